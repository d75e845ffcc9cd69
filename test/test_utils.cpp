#include "test_utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>

#include "util/Process.hpp"

namespace fs = std::filesystem;

namespace promptline::test::utils {

fs::path createTempDir() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string dirname = "promptline_test_";
    for (int i = 0; i < 8; ++i) {
        dirname += "0123456789abcdef"[dis(gen)];
    }

    fs::path tempDir = fs::temp_directory_path() / dirname;
    fs::create_directories(tempDir);
    return tempDir;
}

void removeDir(const fs::path& dir) {
    if (fs::exists(dir)) {
        fs::remove_all(dir);
    }
}

fs::path createFile(
    const fs::path& baseDir,
    const std::string& filename,
    const std::string& content
) {
    fs::path filePath = baseDir / filename;

    // Create parent directories if needed
    fs::create_directories(filePath.parent_path());

    std::ofstream file(filePath);
    file << content;
    file.close();

    return filePath;
}

fs::path createFakeGit(const fs::path& baseDir, const std::string& output, int exitCode) {
    fs::path payload = createFile(baseDir, "fake-git.out", output);
    std::string script = "#!/bin/sh\ncat '" + payload.string() + "'\nexit " + std::to_string(exitCode) + "\n";
    fs::path scriptPath = createFile(baseDir, "fake-git", script);
    fs::permissions(scriptPath, fs::perms::owner_all, fs::perm_options::add);
    return scriptPath;
}

bool runGit(const fs::path& dir, const std::vector<std::string>& args) {
    std::vector<std::string> argv{"git", "-C", dir.string()};
    argv.insert(argv.end(), args.begin(), args.end());
    auto res = runProcess(argv);
    return res && res.value().exitCode == 0;
}

bool gitAvailable() {
    auto res = runProcess({"git", "--version"});
    return res && res.value().exitCode == 0;
}

fs::path getCwd() {
    return fs::current_path();
}

void setCwd(const fs::path& dir) {
    fs::current_path(dir);
}

ScopedEnv::ScopedEnv(const std::string& n, const std::optional<std::string>& value) : name(n) {
    if (const char* old = std::getenv(name.c_str())) previous = old;
    if (value) {
        ::setenv(name.c_str(), value->c_str(), 1);
    } else {
        ::unsetenv(name.c_str());
    }
}

ScopedEnv::~ScopedEnv() {
    if (previous) {
        ::setenv(name.c_str(), previous->c_str(), 1);
    } else {
        ::unsetenv(name.c_str());
    }
}

} // namespace promptline::test::utils

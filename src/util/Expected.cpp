#include "util/Expected.hpp"

namespace promptline {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::GitUnavailable: return "git-unavailable";
        case ErrorCode::NotARepository: return "not-a-repository";
        case ErrorCode::MissingData: return "missing-data";
        case ErrorCode::MalformedLine: return "malformed-line";
        case ErrorCode::ConfigurationError: return "configuration-error";
        case ErrorCode::IoError: return "io-error";
    }
    return "unknown";
}

}

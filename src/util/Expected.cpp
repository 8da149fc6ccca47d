#include "util/Expected.hpp"

namespace improver {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::DuplicateCommand: return "duplicate-command";
        case ErrorCode::UnknownCommand: return "unknown-command";
        case ErrorCode::RegistrySealed: return "registry-sealed";
        case ErrorCode::NotSupported: return "not-supported";
        case ErrorCode::RenderMismatch: return "render-mismatch";
        case ErrorCode::HarnessTimeout: return "harness-timeout";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::InternalError: return "internal-error";
    }
    return "unknown";
}

}

#include "rangedl/errors.hpp"

namespace rangedl {

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Setup: return "setup";
        case ErrorKind::Write: return "write";
        case ErrorKind::Finalize: return "finalize";
        case ErrorKind::Config: return "config";
    }
    return "unknown";
}

DownloadError::DownloadError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

} // namespace rangedl

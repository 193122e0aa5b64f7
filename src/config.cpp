#include "rangedl/config.hpp"
#include "rangedl/errors.hpp"

#include <fmt/format.h>

namespace rangedl {

void DownloaderConfig::validate() const {
    if (chunk_size == 0) {
        throw DownloadError(ErrorKind::Config, "Chunk size must be positive");
    }
    if (worker_count <= 0 || worker_count > kMaxWorkerCount) {
        throw DownloadError(ErrorKind::Config,
            fmt::format("Worker count must be between 1 and {}, got {}", kMaxWorkerCount, worker_count));
    }
    if (temp_extension.empty()) {
        throw DownloadError(ErrorKind::Config, "Temp file extension must not be empty");
    }
    if (max_retries < 0) {
        throw DownloadError(ErrorKind::Config, fmt::format("Retry count must not be negative, got {}", max_retries));
    }
    if (retry_backoff.count() < 0) {
        throw DownloadError(ErrorKind::Config, "Retry backoff must not be negative");
    }
    if (transport.max_redirects < 0) {
        throw DownloadError(ErrorKind::Config, "Redirect limit must not be negative");
    }
}

} // namespace rangedl

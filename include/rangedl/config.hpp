#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace rangedl {

inline constexpr std::uint64_t kDefaultChunkSize = 32 * 1024;
inline constexpr int kDefaultWorkerCount = 10;
inline constexpr int kMaxWorkerCount = 64;
inline constexpr const char* kDownloadExtension = ".ptdownload";

struct TransportOptions {
    std::chrono::seconds connect_timeout{30};
    // A transfer slower than low_speed_limit bytes/s for low_speed_time is a transport error.
    long low_speed_limit{1};
    std::chrono::seconds low_speed_time{60};
    long max_redirects{10};
    std::string user_agent{"rangedl/0.1"};
};

struct DownloaderConfig {
    std::uint64_t chunk_size{kDefaultChunkSize};
    int worker_count{kDefaultWorkerCount};
    std::string temp_extension{kDownloadExtension};

    // Transport failures are retried in-process; 0 defers the range to the next run.
    int max_retries{3};
    std::chrono::milliseconds retry_backoff{std::chrono::seconds(10)};

    TransportOptions transport{};

    // Throws DownloadError(ErrorKind::Config) on the first invalid field.
    void validate() const;
};

} // namespace rangedl

#pragma once

#include "config.hpp"
#include "download_job.hpp"
#include "event_channel.hpp"
#include "range_plan.hpp"
#include "range_transport.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace rangedl {

enum class FetchStatus {
    Completed,
    TransportFailed,
    WriteFailed,
    Cancelled
};

[[nodiscard]] const char* fetchStatusName(FetchStatus status) noexcept;

// Fills one assignment of a job from the remote file. Bytes are written in
// chunk-sized buffers at their own offsets, and chunks are credited to the job
// as the write cursor passes them.
class RangeFetcher {
public:
    RangeFetcher(DownloadJob& job,
                 RangeTransport& transport,
                 const DownloaderConfig& config,
                 ProgressChannel* events = nullptr);

    FetchStatus run(const RangeAssignment& range);

    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return bytes_written_; }
    [[nodiscard]] int attempts() const noexcept { return attempts_; }

private:
    enum class StreamStop {
        None,
        Filled,
        WriteError,
        Cancelled
    };

    struct Stream {
        RangeAssignment range;
        std::uint64_t cursor{0};
        std::vector<char> buffer;
        StreamStop stop{StreamStop::None};
        std::string error;
    };

    TransferResult fetchOnce(Stream& stream);
    bool accept(Stream& stream, const char* data, std::size_t size);
    bool flush(Stream& stream);
    void creditPassedChunks(const Stream& stream);
    void publish(ProgressEvent event);

    DownloadJob& job_;
    RangeTransport& transport_;
    const DownloaderConfig& config_;
    ProgressChannel* events_;
    std::shared_ptr<spdlog::logger> logger_;

    std::uint64_t next_chunk_{0};
    std::uint64_t end_chunk_{0};
    std::uint64_t bytes_written_{0};
    int attempts_{0};
};

} // namespace rangedl

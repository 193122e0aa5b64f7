#include "rangedl/range_fetcher.hpp"
#include "rangedl/logging.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace rangedl {

const char* fetchStatusName(FetchStatus status) noexcept {
    switch (status) {
        case FetchStatus::Completed: return "completed";
        case FetchStatus::TransportFailed: return "transport-failed";
        case FetchStatus::WriteFailed: return "write-failed";
        case FetchStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

RangeFetcher::RangeFetcher(DownloadJob& job,
                           RangeTransport& transport,
                           const DownloaderConfig& config,
                           ProgressChannel* events)
    : job_(job), transport_(transport), config_(config), events_(events), logger_(logger()) {}

FetchStatus RangeFetcher::run(const RangeAssignment& range) {
    const std::string& name = job_.file().name;
    publish(ProgressEvent::scheduled(name, range.length));
    if (range.empty()) {
        return FetchStatus::Completed;
    }

    const auto& geometry = job_.geometry();
    next_chunk_ = geometry.chunkOf(range.offset);
    end_chunk_ = (range.end() + geometry.chunkSize() - 1) / geometry.chunkSize();

    Stream stream;
    stream.range = range;
    stream.cursor = range.offset;
    stream.buffer.reserve(static_cast<std::size_t>(config_.chunk_size));

    logger_->debug("{}: fetching bytes {}-{}", name, range.offset, range.end() - 1);

    while (true) {
        if (job_.cancelled()) {
            return FetchStatus::Cancelled;
        }

        ++attempts_;
        const std::uint64_t started_at = stream.cursor;
        const TransferResult result = fetchOnce(stream);

        if (stream.stop == StreamStop::WriteError) {
            logger_->error("{}: write failed at byte {}: {}", name, stream.cursor, stream.error);
            return FetchStatus::WriteFailed;
        }
        if (stream.stop == StreamStop::Cancelled) {
            logger_->info("{}: range {}-{} cancelled at byte {}", name, range.offset, range.end() - 1, stream.cursor);
            return FetchStatus::Cancelled;
        }
        if (stream.cursor >= range.end()) {
            return FetchStatus::Completed;
        }

        const std::string reason = result.failed()
            ? result.message
            : fmt::format("stream ended early at byte {}", stream.cursor);
        if (attempts_ > config_.max_retries) {
            logger_->warn("{}: range {}-{} gave up at byte {} after {} attempt(s): {}",
                          name, range.offset, range.end() - 1, stream.cursor, attempts_, reason);
            return FetchStatus::TransportFailed;
        }

        logger_->warn("{}: {} after {} bytes (retry {}/{} in {}ms)", name, reason,
                      stream.cursor - started_at, attempts_, config_.max_retries, config_.retry_backoff.count());

        const auto deadline = std::chrono::steady_clock::now() + config_.retry_backoff;
        while (!job_.cancelled() && std::chrono::steady_clock::now() < deadline) {
            const auto left = deadline - std::chrono::steady_clock::now();
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(left, std::chrono::milliseconds(100)));
        }
    }
}

TransferResult RangeFetcher::fetchOnce(Stream& stream) {
    stream.stop = StreamStop::None;
    stream.buffer.clear();

    const TransferResult result = transport_.fetch(
        job_.file().download_url, stream.cursor, stream.range.end() - 1,
        [this, &stream](const char* data, std::size_t size) { return accept(stream, data, size); });

    // Bytes received before a broken transfer are still good; keep them so a
    // retry starts exactly where this one stopped.
    if (stream.stop == StreamStop::None) {
        flush(stream);
    }
    return result;
}

bool RangeFetcher::accept(Stream& stream, const char* data, std::size_t size) {
    if (job_.cancelled()) {
        stream.stop = StreamStop::Cancelled;
        return false;
    }

    const std::uint64_t received = stream.cursor + stream.buffer.size();
    const std::uint64_t room = stream.range.end() - received;
    const bool overflow = size > room;
    std::size_t remaining = static_cast<std::size_t>(std::min<std::uint64_t>(size, room));

    while (remaining > 0) {
        const std::size_t take = std::min(remaining, static_cast<std::size_t>(config_.chunk_size) - stream.buffer.size());
        stream.buffer.insert(stream.buffer.end(), data, data + take);
        data += take;
        remaining -= take;
        if (stream.buffer.size() == config_.chunk_size && !flush(stream)) {
            return false;
        }
    }

    if (stream.cursor + stream.buffer.size() >= stream.range.end()) {
        if (!flush(stream)) {
            return false;
        }
        stream.stop = StreamStop::Filled;
        // Anything past our last byte belongs to another worker.
        return !overflow;
    }
    return true;
}

bool RangeFetcher::flush(Stream& stream) {
    if (stream.buffer.empty()) {
        return true;
    }
    if (job_.cancelled()) {
        stream.stop = StreamStop::Cancelled;
        return false;
    }

    const std::size_t size = stream.buffer.size();
    try {
        job_.writeAt(stream.buffer.data(), size, stream.cursor);
        stream.cursor += size;
        stream.buffer.clear();
        bytes_written_ += size;
        creditPassedChunks(stream);
    } catch (const std::system_error& ex) {
        stream.stop = StreamStop::WriteError;
        stream.error = ex.what();
        return false;
    }

    publish(ProgressEvent::downloaded(job_.file().name, size));
    return true;
}

void RangeFetcher::creditPassedChunks(const Stream& stream) {
    const auto& geometry = job_.geometry();
    while (next_chunk_ < end_chunk_) {
        // Our share of the chunk: the part inside the assignment.
        const std::uint64_t share_end = std::min(geometry.chunkEnd(next_chunk_), stream.range.end());
        if (stream.cursor < share_end) {
            break;
        }
        const std::uint64_t share_begin = std::max(geometry.chunkBegin(next_chunk_), stream.range.offset);
        job_.creditChunk(next_chunk_, share_end - share_begin);
        ++next_chunk_;
    }
}

void RangeFetcher::publish(ProgressEvent event) {
    if (events_) {
        events_->tryPush(std::move(event));
    }
}

} // namespace rangedl

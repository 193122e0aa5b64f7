#include "rangedl/download_job.hpp"
#include "rangedl/errors.hpp"
#include "rangedl/logging.hpp"

#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <fmt/format.h>

namespace rangedl {

const char* jobStateName(JobState state) noexcept {
    switch (state) {
        case JobState::Fresh: return "fresh";
        case JobState::Resuming: return "resuming";
        case JobState::Running: return "running";
        case JobState::Incomplete: return "incomplete";
        case JobState::Finalized: return "finalized";
        case JobState::Failed: return "failed";
    }
    return "unknown";
}

std::string tempPathFor(const std::string& destination, const DownloaderConfig& config) {
    if (config.chunk_size == kDefaultChunkSize) {
        return destination + config.temp_extension;
    }
    return fmt::format("{}.{}{}", destination, config.chunk_size, config.temp_extension);
}

DownloadJob::DownloadJob(Token, FileDescriptor file, std::string destination, const DownloaderConfig& config)
    : file_(std::move(file)),
      destination_(std::move(destination)),
      temp_path_(tempPathFor(destination_, config)),
      geometry_(file_.size, config.chunk_size),
      bitmap_(geometry_.chunkCount()) {}

DownloadJob::~DownloadJob() = default;

std::unique_ptr<DownloadJob> DownloadJob::open(const FileDescriptor& file,
                                               const std::string& destination,
                                               const DownloaderConfig& config) {
    auto job = std::make_unique<DownloadJob>(Token{}, file, destination, config);
    auto log = logger();
    const std::uint64_t expected = job->geometry_.fileSize() + job->geometry_.bitmapBytes();

    std::error_code ec;
    const bool exists = std::filesystem::exists(job->temp_path_, ec);
    if (ec) {
        throw DownloadError(ErrorKind::Setup, fmt::format("Cannot stat {}: {}", job->temp_path_, ec.message()));
    }

    try {
        if (!exists) {
            log->info("Downloading: {}", file.name);
            job->handle_ = detail::FileHandle::open(job->temp_path_, O_RDWR | O_CREAT | O_EXCL);
            job->create();
            return job;
        }

        job->handle_ = detail::FileHandle::open(job->temp_path_, O_RDWR);
        const std::uint64_t actual = job->handle_.size();
        if (actual != expected) {
            log->warn("Discarding stale partial download {} ({} bytes, expected {})",
                      job->temp_path_, actual, expected);
            job->handle_.truncate(0);
            job->create();
            return job;
        }

        std::vector<std::uint8_t> bytes(job->geometry_.bitmapBytes());
        if (!bytes.empty()) {
            job->handle_.readAt(bytes.data(), bytes.size(), job->geometry_.fileSize());
        }
        job->bitmap_ = ProgressBitmap::fromBytes(job->geometry_.chunkCount(), std::move(bytes));
        job->resumed_ = true;
        job->state_.store(JobState::Resuming);
        log->info("Resuming: {} ({}/{} chunks present)", file.name,
                  job->bitmap_.countSet(), job->geometry_.chunkCount());
    } catch (const std::system_error& ex) {
        throw DownloadError(ErrorKind::Setup, fmt::format("Cannot prepare {}: {}", job->temp_path_, ex.what()));
    }
    return job;
}

void DownloadJob::create() {
    // Sparse payload followed by an all-zero bitmap.
    handle_.truncate(geometry_.fileSize() + geometry_.bitmapBytes());
    bitmap_ = ProgressBitmap(geometry_.chunkCount());
    partial_chunks_.clear();
    resumed_ = false;
    state_.store(JobState::Fresh);
}

void DownloadJob::writeAt(const char* data, std::size_t size, std::uint64_t offset) {
    if (offset + size > geometry_.fileSize()) {
        throw std::system_error(std::make_error_code(std::errc::invalid_argument),
            fmt::format("write of {} bytes at {} runs past payload of {}", size, offset, geometry_.fileSize()));
    }
    handle_.writeAt(data, size, offset);
}

bool DownloadJob::creditChunk(std::uint64_t chunk, std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(bitmap_mutex_);
    if (bitmap_.test(chunk)) {
        return false;
    }

    const std::uint64_t length = geometry_.chunkLength(chunk);
    if (bytes < length) {
        auto& credited = partial_chunks_[chunk];
        credited += bytes;
        if (credited < length) {
            return false;
        }
    }

    partial_chunks_.erase(chunk);
    bitmap_.set(chunk);
    persistBitmapLocked();
    return true;
}

void DownloadJob::persistBitmapLocked() {
    const auto& bytes = bitmap_.bytes();
    handle_.writeAt(bytes.data(), bytes.size(), geometry_.fileSize());
}

ProgressBitmap DownloadJob::bitmapSnapshot() const {
    std::lock_guard<std::mutex> lock(bitmap_mutex_);
    return bitmap_;
}

std::optional<std::uint64_t> DownloadJob::firstMissingChunk() const {
    std::lock_guard<std::mutex> lock(bitmap_mutex_);
    return bitmap_.firstZero(0, geometry_.chunkCount());
}

void DownloadJob::finalize() {
    try {
        handle_.truncate(geometry_.fileSize());
        handle_.sync();
        handle_.close();
    } catch (const std::system_error& ex) {
        state_.store(JobState::Failed);
        throw DownloadError(ErrorKind::Finalize, fmt::format("Cannot finalize {}: {}", temp_path_, ex.what()));
    }

    std::error_code ec;
    std::filesystem::rename(temp_path_, destination_, ec);
    if (ec) {
        state_.store(JobState::Failed);
        restoreBitmap();
        throw DownloadError(ErrorKind::Finalize,
            fmt::format("Cannot rename {} to {}: {}", temp_path_, destination_, ec.message()));
    }
    state_.store(JobState::Finalized);
}

void DownloadJob::restoreBitmap() {
    // Put the trailing bitmap back so the next run resumes instead of restarting.
    try {
        auto handle = detail::FileHandle::open(temp_path_, O_RDWR);
        handle.truncate(geometry_.fileSize() + geometry_.bitmapBytes());
        std::lock_guard<std::mutex> lock(bitmap_mutex_);
        handle.writeAt(bitmap_.bytes().data(), bitmap_.bytes().size(), geometry_.fileSize());
        handle.close();
    } catch (const std::system_error& ex) {
        logger()->warn("Cannot restore progress of {}: {}", temp_path_, ex.what());
    }
}

void DownloadJob::release() {
    try {
        handle_.close();
    } catch (const std::system_error& ex) {
        logger()->warn("Closing {} failed: {}", temp_path_, ex.what());
    }
}

} // namespace rangedl

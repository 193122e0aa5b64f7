#pragma once

#include "config.hpp"
#include "detail/file_handle.hpp"
#include "file_descriptor.hpp"
#include "progress_bitmap.hpp"
#include "range_plan.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace rangedl {

enum class JobState {
    Fresh,
    Resuming,
    Running,
    Incomplete,
    Finalized,
    Failed
};

[[nodiscard]] const char* jobStateName(JobState state) noexcept;

// <destination><temp_extension> for the default chunk size, otherwise
// <destination>.<chunk_size><temp_extension>. Bitmap bits only mean something
// for the chunk size that wrote them, so each size gets its own temp file.
[[nodiscard]] std::string tempPathFor(const std::string& destination, const DownloaderConfig& config);

// One file's temp file, its trailing progress bitmap and the lock guarding both.
//
// Temp file layout: [0, size) payload, [size, size + bitmapBytes) bitmap.
class DownloadJob {
    struct Token {
        explicit Token() = default;
    };

public:
    DownloadJob(Token, FileDescriptor file, std::string destination, const DownloaderConfig& config);

    // Creates the temp file, or reopens it and reloads its bitmap when one exists.
    // Throws DownloadError(ErrorKind::Setup) if the temp file cannot be prepared.
    static std::unique_ptr<DownloadJob> open(const FileDescriptor& file,
                                             const std::string& destination,
                                             const DownloaderConfig& config);

    ~DownloadJob();

    DownloadJob(const DownloadJob&) = delete;
    DownloadJob& operator=(const DownloadJob&) = delete;

    [[nodiscard]] const FileDescriptor& file() const noexcept { return file_; }
    [[nodiscard]] const std::string& destination() const noexcept { return destination_; }
    [[nodiscard]] const std::string& tempPath() const noexcept { return temp_path_; }
    [[nodiscard]] const ChunkGeometry& geometry() const noexcept { return geometry_; }

    [[nodiscard]] JobState state() const noexcept { return state_.load(); }
    [[nodiscard]] bool resuming() const noexcept { return resumed_; }
    void setState(JobState state) noexcept { state_.store(state); }

    // Positional write into the payload region. Throws std::system_error.
    void writeAt(const char* data, std::size_t size, std::uint64_t offset);

    // Records that `bytes` of `chunk` have been written by one assignment. The
    // chunk is marked, and the bitmap persisted, once its whole length is
    // accounted for. Returns true when this call completed the chunk.
    bool creditChunk(std::uint64_t chunk, std::uint64_t bytes);

    [[nodiscard]] ProgressBitmap bitmapSnapshot() const;
    [[nodiscard]] std::optional<std::uint64_t> firstMissingChunk() const;

    void cancel() noexcept { cancelled_.store(true); }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

    // Truncates to the payload size, closes and renames onto the destination.
    // Throws DownloadError(ErrorKind::Finalize).
    void finalize();

    // Closes the handle and leaves the temp file for a later run.
    void release();

private:
    void create();
    void persistBitmapLocked();
    void restoreBitmap();

    FileDescriptor file_;
    std::string destination_;
    std::string temp_path_;
    ChunkGeometry geometry_;

    detail::FileHandle handle_;

    mutable std::mutex bitmap_mutex_;
    ProgressBitmap bitmap_;
    std::map<std::uint64_t, std::uint64_t> partial_chunks_;

    std::atomic<JobState> state_{JobState::Fresh};
    std::atomic<bool> cancelled_{false};
    bool resumed_{false};
};

} // namespace rangedl

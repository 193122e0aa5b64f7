#pragma once

#include "config.hpp"
#include "event_channel.hpp"
#include "file_descriptor.hpp"
#include "progress_bitmap.hpp"
#include "range_fetcher.hpp"
#include "range_plan.hpp"
#include "range_transport.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rangedl {

enum class JobOutcome {
    Finalized,
    Incomplete,
    Failed
};

[[nodiscard]] const char* jobOutcomeName(JobOutcome outcome) noexcept;

struct WorkerReport {
    RangeAssignment range;
    FetchStatus status{FetchStatus::Completed};
    std::uint64_t bytes_written{0};
    int attempts{0};
};

struct JobResult {
    JobOutcome outcome{JobOutcome::Incomplete};
    bool resumed{false};
    std::vector<WorkerReport> workers;
    // Bitmap as it stood after every worker joined, before finalize.
    ProgressBitmap bitmap;
};

// Runs one file's transfer: prepares or resumes the temp file, splits the
// payload across workers, joins them and publishes the file once complete.
class DownloadCoordinator {
public:
    DownloadCoordinator(DownloaderConfig config,
                        std::shared_ptr<RangeTransport> transport,
                        ProgressChannel* events = nullptr);
    ~DownloadCoordinator();

    DownloadCoordinator(const DownloadCoordinator&) = delete;
    DownloadCoordinator& operator=(const DownloadCoordinator&) = delete;

    // Throws DownloadError for setup and finalize failures. An incomplete
    // transfer is not an error: the temp file is kept for the next run.
    JobResult runJob(const FileDescriptor& file, const std::string& destination);

    // Stops every job this coordinator is running; their workers end Cancelled.
    void cancel();

    [[nodiscard]] const DownloaderConfig& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rangedl

#include "rangedl/download_coordinator.hpp"
#include "rangedl/download_job.hpp"
#include "rangedl/errors.hpp"
#include "rangedl/logging.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace rangedl {

const char* jobOutcomeName(JobOutcome outcome) noexcept {
    switch (outcome) {
        case JobOutcome::Finalized: return "finalized";
        case JobOutcome::Incomplete: return "incomplete";
        case JobOutcome::Failed: return "failed";
    }
    return "unknown";
}

class DownloadCoordinator::Impl {
public:
    Impl(DownloaderConfig config, std::shared_ptr<RangeTransport> transport, ProgressChannel* events)
        : config_(std::move(config)),
          transport_(std::move(transport)),
          events_(events),
          logger_(logger()) {
        config_.validate();
        if (!transport_) {
            throw DownloadError(ErrorKind::Config, "A range transport is required");
        }
    }

    JobResult runJob(const FileDescriptor& file, const std::string& destination) {
        std::unique_ptr<DownloadJob> job;
        try {
            job = DownloadJob::open(file, destination, config_);
        } catch (const DownloadError& ex) {
            logger_->error("{}", ex.what());
            publish(ProgressEvent::finished(ProgressEvent::Kind::Failed, file.name, ex.what()));
            throw;
        }
        ActiveJob active(*this, *job);

        JobResult result;
        result.resumed = job->resuming();
        publish(ProgressEvent::totalSize(file.name, file.size));

        const auto plan = planAssignments(*job);
        job->setState(JobState::Running);
        result.workers = runWorkers(*job, plan);

        result.bitmap = job->bitmapSnapshot();
        const auto missing = result.bitmap.firstZero(0, job->geometry().chunkCount());
        if (missing) {
            const bool write_failed = std::any_of(result.workers.begin(), result.workers.end(),
                [](const WorkerReport& w) { return w.status == FetchStatus::WriteFailed; });
            job->release();
            if (write_failed) {
                job->setState(JobState::Failed);
                result.outcome = JobOutcome::Failed;
                logger_->error("Download failed, local write error: {}", file.name);
                publish(ProgressEvent::finished(ProgressEvent::Kind::Failed, file.name, "local write error"));
            } else {
                job->setState(JobState::Incomplete);
                result.outcome = JobOutcome::Incomplete;
                logger_->info("All chunks are not downloaded, deferring {} (first missing chunk {} of {})",
                              file.name, *missing, job->geometry().chunkCount());
                publish(ProgressEvent::finished(ProgressEvent::Kind::Incomplete, file.name));
            }
            return result;
        }

        try {
            job->finalize();
        } catch (const DownloadError& ex) {
            logger_->error("{}", ex.what());
            publish(ProgressEvent::finished(ProgressEvent::Kind::Failed, file.name, ex.what()));
            throw;
        }
        result.outcome = JobOutcome::Finalized;
        logger_->info("Download completed: {}", file.name);
        publish(ProgressEvent::finished(ProgressEvent::Kind::Completed, file.name));
        return result;
    }

    void cancel() {
        std::lock_guard<std::mutex> lock(active_mutex_);
        for (auto* job : active_) {
            job->cancel();
        }
    }

    const DownloaderConfig& config() const noexcept { return config_; }

private:
    // Registers a job for cancel() while it runs.
    class ActiveJob {
    public:
        ActiveJob(Impl& owner, DownloadJob& job) : owner_(owner), job_(job) {
            std::lock_guard<std::mutex> lock(owner_.active_mutex_);
            owner_.active_.push_back(&job_);
        }
        ~ActiveJob() {
            std::lock_guard<std::mutex> lock(owner_.active_mutex_);
            owner_.active_.erase(std::remove(owner_.active_.begin(), owner_.active_.end(), &job_),
                                 owner_.active_.end());
        }
        ActiveJob(const ActiveJob&) = delete;
        ActiveJob& operator=(const ActiveJob&) = delete;

    private:
        Impl& owner_;
        DownloadJob& job_;
    };

    std::vector<RangeAssignment> planAssignments(const DownloadJob& job) const {
        std::vector<RangeAssignment> plan;
        const auto bitmap = job.bitmapSnapshot();
        for (const auto& range : splitRanges(job.file().size, config_.worker_count)) {
            if (!job.resuming()) {
                if (!range.empty()) {
                    plan.push_back(range);
                }
                continue;
            }
            // Adjusting the range for the previously downloaded part.
            if (auto adjusted = resumeRange(range, bitmap, job.geometry())) {
                plan.push_back(*adjusted);
            }
        }
        return plan;
    }

    std::vector<WorkerReport> runWorkers(DownloadJob& job, const std::vector<RangeAssignment>& plan) {
        std::vector<WorkerReport> reports(plan.size());
        std::vector<std::thread> workers;
        workers.reserve(plan.size());

        for (std::size_t i = 0; i < plan.size(); ++i) {
            reports[i].range = plan[i];
            workers.emplace_back([this, &job, &report = reports[i]]() {
                RangeFetcher fetcher(job, *transport_, config_, events_);
                report.status = fetcher.run(report.range);
                report.bytes_written = fetcher.bytesWritten();
                report.attempts = fetcher.attempts();
            });
        }

        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        return reports;
    }

    void publish(ProgressEvent event) {
        if (events_) {
            events_->tryPush(std::move(event));
        }
    }

    DownloaderConfig config_;
    std::shared_ptr<RangeTransport> transport_;
    ProgressChannel* events_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex active_mutex_;
    std::vector<DownloadJob*> active_;
};

DownloadCoordinator::DownloadCoordinator(DownloaderConfig config,
                                         std::shared_ptr<RangeTransport> transport,
                                         ProgressChannel* events)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(transport), events)) {}

DownloadCoordinator::~DownloadCoordinator() = default;

JobResult DownloadCoordinator::runJob(const FileDescriptor& file, const std::string& destination) {
    return impl_->runJob(file, destination);
}

void DownloadCoordinator::cancel() { impl_->cancel(); }

const DownloaderConfig& DownloadCoordinator::config() const noexcept { return impl_->config(); }

} // namespace rangedl

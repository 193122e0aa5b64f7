#pragma once

#include "config.hpp"
#include "download_coordinator.hpp"
#include "event_channel.hpp"
#include "file_descriptor.hpp"
#include "progress_reporter.hpp"
#include "range_transport.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace rangedl {

// Runs several files side by side, one coordinator thread per file, while
// rendering the aggregated progress panel.
class DownloadManager {
public:
    struct Task {
        FileDescriptor file;
        std::string destination;
        std::optional<JobOutcome> outcome;
        std::string error;
    };

    DownloadManager(DownloaderConfig config, std::shared_ptr<RangeTransport> transport, bool render = true);

    void addTask(FileDescriptor file, std::string destination);
    void start();

    [[nodiscard]] const std::vector<Task>& tasks() const noexcept { return tasks_; }
    [[nodiscard]] bool hasErrors() const;
    void printErrors(std::ostream& out) const;

private:
    void runTask(Task& task);
    void renderProgressLoop(const std::atomic<std::size_t>& finished, std::size_t& previous_lines);
    void redrawPanel(const std::string& panel, std::size_t& previous_lines);

    DownloaderConfig config_;
    std::shared_ptr<RangeTransport> transport_;
    bool render_;
    ProgressChannel events_;
    ProgressReporter reporter_;
    std::vector<Task> tasks_;
};

} // namespace rangedl

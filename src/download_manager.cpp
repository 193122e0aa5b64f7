#include "rangedl/download_manager.hpp"
#include "rangedl/errors.hpp"
#include "rangedl/logging.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace rangedl {

DownloadManager::DownloadManager(DownloaderConfig config, std::shared_ptr<RangeTransport> transport, bool render)
    : config_(std::move(config)), transport_(std::move(transport)), render_(render), events_(4096) {
    config_.validate();
}

void DownloadManager::addTask(FileDescriptor file, std::string destination) {
    tasks_.push_back(Task{std::move(file), std::move(destination), std::nullopt, {}});
}

void DownloadManager::start() {
    std::thread reporter_thread([this]() { reporter_.drain(events_); });

    std::atomic<std::size_t> finished{0};
    std::vector<std::thread> threads;
    threads.reserve(tasks_.size());
    for (auto& task : tasks_) {
        threads.emplace_back([this, &task, &finished]() {
            runTask(task);
            finished.fetch_add(1);
        });
    }

    std::size_t previous_lines = 0;
    if (render_) {
        renderProgressLoop(finished, previous_lines);
    }

    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    events_.close();
    reporter_thread.join();

    if (render_) {
        redrawPanel(reporter_.buildPanel(), previous_lines);
    }
}

void DownloadManager::runTask(Task& task) {
    // One file's failure must not stop the others.
    try {
        DownloadCoordinator coordinator(config_, transport_, &events_);
        const auto result = coordinator.runJob(task.file, task.destination);
        task.outcome = result.outcome;
        if (result.outcome == JobOutcome::Failed) {
            task.error = "local write error, partial download kept";
        } else if (result.outcome == JobOutcome::Incomplete) {
            task.error = "incomplete, run again to resume";
        }
    } catch (const DownloadError& ex) {
        task.outcome = JobOutcome::Failed;
        task.error = fmt::format("{} error: {}", errorKindName(ex.kind()), ex.what());
    } catch (const std::exception& ex) {
        task.outcome = JobOutcome::Failed;
        task.error = ex.what();
        logger()->error("{}: {}", task.file.name, ex.what());
    }
}

bool DownloadManager::hasErrors() const {
    return std::any_of(tasks_.begin(), tasks_.end(), [](const Task& task) {
        return !task.outcome || *task.outcome != JobOutcome::Finalized;
    });
}

void DownloadManager::printErrors(std::ostream& out) const {
    for (const auto& task : tasks_) {
        if (task.outcome && *task.outcome == JobOutcome::Finalized) {
            continue;
        }
        out << fmt::format("{}: {}\n", task.destination, task.error.empty() ? "not run" : task.error);
    }
}

void DownloadManager::renderProgressLoop(const std::atomic<std::size_t>& finished, std::size_t& previous_lines) {
    while (finished.load() < tasks_.size()) {
        redrawPanel(reporter_.buildPanel(), previous_lines);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    std::cout << std::flush;
}

void DownloadManager::redrawPanel(const std::string& panel, std::size_t& previous_lines) {
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines > 0) {
        std::cout << "\033[" << previous_lines << "F\033[J";
    }
    std::cout << panel;
    previous_lines = current_lines;
}

} // namespace rangedl

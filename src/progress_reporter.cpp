#include "rangedl/progress_reporter.hpp"

#include <filesystem>

#include <fmt/format.h>

namespace rangedl {

void ProgressReporter::consume(const ProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& progress = files_[event.file];
    progress.filename = event.file;

    switch (event.kind) {
        case ProgressEvent::Kind::TotalSize:
            progress.total_bytes = event.bytes;
            progress.is_running = true;
            break;
        case ProgressEvent::Kind::Scheduled:
            progress.scheduled_bytes += event.bytes;
            progress.is_running = true;
            break;
        case ProgressEvent::Kind::Downloaded:
            progress.downloaded_bytes += event.bytes;
            break;
        case ProgressEvent::Kind::Completed:
            progress.is_running = false;
            progress.is_done = true;
            break;
        case ProgressEvent::Kind::Incomplete:
            progress.is_running = false;
            progress.error_message = "incomplete, will resume";
            break;
        case ProgressEvent::Kind::Failed:
            progress.is_running = false;
            progress.has_error = true;
            progress.error_message = event.message;
            break;
    }
}

void ProgressReporter::drain(ProgressChannel& channel) {
    while (auto event = channel.pop()) {
        consume(*event);
    }
}

std::vector<Progress> ProgressReporter::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Progress> out;
    out.reserve(files_.size());
    for (const auto& entry : files_) {
        out.push_back(entry.second);
    }
    return out;
}

ProgressReporter::Totals ProgressReporter::totals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Totals totals;
    for (const auto& entry : files_) {
        totals.total_bytes += entry.second.total_bytes;
        totals.scheduled_bytes += entry.second.scheduled_bytes;
        totals.downloaded_bytes += entry.second.downloaded_bytes;
    }
    return totals;
}

std::string ProgressReporter::buildPanel() const {
    const auto files = snapshot();
    const auto all = totals();

    std::string panel;
    panel.reserve(files.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("rangedl ({} files)\n", files.size());
    panel.append("--------------------------------------------------\n");

    for (const auto& progress : files) {
        panel += formatTaskLine(progress);
        panel.push_back('\n');
    }

    panel.append("--------------------------------------------------\n");
    if (all.scheduled_bytes > 0) {
        const double ratio = static_cast<double>(all.downloaded_bytes) / static_cast<double>(all.scheduled_bytes);
        panel += fmt::format("Overall: {:>3}% of {} this run", static_cast<int>(ratio * 100.0),
                             formatSize(all.scheduled_bytes));
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string ProgressReporter::formatTaskLine(const Progress& progress) {
    std::string display_name = std::filesystem::path{progress.filename}.filename().string();
    if (display_name.empty()) {
        display_name = progress.filename;
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    if (progress.scheduled_bytes == 0 && !progress.is_done) {
        return fmt::format("{:<20} [Initializing...]", display_name);
    }

    // A resumed file only schedules what is missing; a finished one is full.
    double ratio = 1.0;
    if (!progress.is_done && progress.scheduled_bytes > 0) {
        ratio = static_cast<double>(progress.downloaded_bytes) / static_cast<double>(progress.scheduled_bytes);
    }
    ratio = ratio > 1.0 ? 1.0 : ratio;

    const int percent = static_cast<int>(ratio * 100.0);
    constexpr int bar_width = 30;
    const int bar_pos = static_cast<int>(ratio * bar_width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? "#" : ".";
    }

    std::string line = fmt::format("{:<20} [{}] {:>3}% ({}/{} of {})",
                                   display_name,
                                   bar,
                                   percent,
                                   formatSize(progress.downloaded_bytes),
                                   formatSize(progress.scheduled_bytes),
                                   formatSize(progress.total_bytes));

    if (progress.has_error) {
        line += fmt::format("  FAILED {}", progress.error_message);
    } else if (progress.is_done) {
        line.append("  Done");
    } else if (!progress.is_running && !progress.error_message.empty()) {
        line += fmt::format("  {}", progress.error_message);
    }
    return line;
}

std::string ProgressReporter::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

} // namespace rangedl

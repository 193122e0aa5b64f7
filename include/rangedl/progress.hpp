#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace rangedl {

struct ProgressEvent {
    enum class Kind {
        Scheduled,  // bytes a worker is about to fetch
        Downloaded, // bytes newly written
        TotalSize,  // size of the file
        Completed,
        Incomplete,
        Failed
    };

    Kind kind{Kind::Downloaded};
    std::string file;
    std::uint64_t bytes{0};
    std::string message;

    static ProgressEvent scheduled(std::string file, std::uint64_t bytes) {
        return {Kind::Scheduled, std::move(file), bytes, {}};
    }
    static ProgressEvent downloaded(std::string file, std::uint64_t bytes) {
        return {Kind::Downloaded, std::move(file), bytes, {}};
    }
    static ProgressEvent totalSize(std::string file, std::uint64_t bytes) {
        return {Kind::TotalSize, std::move(file), bytes, {}};
    }
    static ProgressEvent finished(Kind kind, std::string file, std::string message = {}) {
        return {kind, std::move(file), 0, std::move(message)};
    }
};

// Aggregated view of one file, maintained by ProgressReporter.
struct Progress {
    std::string filename;
    std::uint64_t total_bytes{0};
    std::uint64_t scheduled_bytes{0};
    std::uint64_t downloaded_bytes{0};
    bool is_running{false};
    bool is_done{false};
    bool has_error{false};
    std::string error_message;
};

} // namespace rangedl

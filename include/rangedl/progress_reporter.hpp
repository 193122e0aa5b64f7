#pragma once

#include "event_channel.hpp"
#include "progress.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace rangedl {

// Aggregates progress events per file and renders them as a text panel.
class ProgressReporter {
public:
    struct Totals {
        std::uint64_t total_bytes{0};
        std::uint64_t scheduled_bytes{0};
        std::uint64_t downloaded_bytes{0};
    };

    void consume(const ProgressEvent& event);

    // Consumes events until the channel is closed and drained.
    void drain(ProgressChannel& channel);

    [[nodiscard]] std::vector<Progress> snapshot() const;
    [[nodiscard]] Totals totals() const;
    [[nodiscard]] std::string buildPanel() const;

    static std::string formatTaskLine(const Progress& progress);
    static std::string formatSize(std::uint64_t bytes);

private:
    mutable std::mutex mutex_;
    std::map<std::string, Progress> files_;
};

} // namespace rangedl

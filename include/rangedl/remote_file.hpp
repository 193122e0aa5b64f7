#pragma once

#include "config.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace rangedl {

struct RemoteMetadata {
    bool reachable{false};
    bool supports_range{false};
    // Empty when the server sent no Content-Length.
    std::optional<std::uint64_t> content_length;
    long http_status{0};

    // A known length, and byte ranges unless there is nothing to fetch.
    [[nodiscard]] bool downloadable() const noexcept {
        if (!reachable || !content_length) {
            return false;
        }
        return supports_range || *content_length == 0;
    }
};

// HEAD request following redirects.
[[nodiscard]] RemoteMetadata probeRemoteFile(const std::string& url, const TransportOptions& options = {});

} // namespace rangedl

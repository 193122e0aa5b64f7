#include "rangedl/detail/transfer_callbacks.hpp"

#include <cstdlib>
#include <cstring>

namespace rangedl::detail {

bool acceptsStatus(long status, std::uint64_t first) noexcept {
    return status == 206 || (status == 200 && first == 0);
}

std::size_t headerCallback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const std::size_t total = size * nitems;
    if (total > 5 && std::strncmp(buffer, "HTTP/", 5) == 0) {
        const char* space = static_cast<const char*>(std::memchr(buffer, ' ', total));
        ctx->status = space ? std::strtol(space + 1, nullptr, 10) : 0;
    }
    return total;
}

std::size_t collectHeaders(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    const std::size_t total = size * nitems;
    if (!out) {
        return 0;
    }
    out->append(buffer, total);
    return total;
}

std::size_t writeCallback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const std::size_t total = size * nmemb;
    if (total == 0) {
        return 0;
    }

    if (!acceptsStatus(ctx->status, ctx->first)) {
        ctx->bad_status = true;
        return 0;
    }

    if (!(*ctx->sink)(ptr, total)) {
        ctx->sink_stopped = true;
        return 0;
    }
    return total;
}

} // namespace rangedl::detail

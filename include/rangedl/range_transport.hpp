#pragma once

#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace rangedl {

struct TransferResult {
    enum class Kind {
        Complete, // the server finished sending its body
        Aborted,  // the sink asked to stop
        Failed    // connection, protocol or status error
    };

    Kind kind{Kind::Failed};
    long http_status{0};
    std::string message;

    [[nodiscard]] bool failed() const noexcept { return kind == Kind::Failed; }
};

// Issues one ranged GET and streams the body into a sink.
class RangeTransport {
public:
    // Receives body bytes in arrival order; returning false aborts the transfer.
    using Sink = std::function<bool(const char* data, std::size_t size)>;

    virtual ~RangeTransport() = default;

    // Requests bytes [first, last] (inclusive) of url.
    [[nodiscard]] virtual TransferResult fetch(const std::string& url,
                                               std::uint64_t first,
                                               std::uint64_t last,
                                               const Sink& sink) = 0;
};

class CurlRangeTransport final : public RangeTransport {
public:
    explicit CurlRangeTransport(TransportOptions options = {});

    [[nodiscard]] TransferResult fetch(const std::string& url,
                                       std::uint64_t first,
                                       std::uint64_t last,
                                       const Sink& sink) override;

private:
    TransportOptions options_;
};

} // namespace rangedl

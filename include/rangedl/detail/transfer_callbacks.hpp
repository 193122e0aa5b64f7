#pragma once

#include "rangedl/range_transport.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace rangedl::detail {

// State shared by the libcurl callbacks of one range transfer.
struct TransferContext {
    const RangeTransport::Sink* sink{nullptr};
    std::uint64_t first{0};
    long status{0};
    bool bad_status{false};
    bool sink_stopped{false};
};

// 206 always; 200 only for a range starting at byte 0, whose body then
// starts where the range does.
[[nodiscard]] bool acceptsStatus(long status, std::uint64_t first) noexcept;

// CURLOPT_HEADERFUNCTION. Sees the headers of every hop; the last status line wins.
std::size_t headerCallback(char* buffer, std::size_t size, std::size_t nitems, void* userdata);

// CURLOPT_HEADERFUNCTION for a HEAD request: appends every header line to the
// std::string passed as userdata.
std::size_t collectHeaders(char* buffer, std::size_t size, std::size_t nitems, void* userdata);

// CURLOPT_WRITEFUNCTION. Refuses the body of an unacceptable status and
// forwards everything else to the sink.
std::size_t writeCallback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);

} // namespace rangedl::detail

#include "rangedl/range_transport.hpp"
#include "rangedl/detail/curl_utils.hpp"
#include "rangedl/detail/transfer_callbacks.hpp"

#include <memory>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace rangedl {

CurlRangeTransport::CurlRangeTransport(TransportOptions options) : options_(std::move(options)) {
    detail::ensureCurlInitialized();
}

TransferResult CurlRangeTransport::fetch(const std::string& url,
                                         std::uint64_t first,
                                         std::uint64_t last,
                                         const Sink& sink) {
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    TransferResult result;
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        result.message = "Failed to allocate curl handle";
        return result;
    }

    detail::TransferContext ctx;
    ctx.sink = &sink;
    ctx.first = first;

    // libcurl sends CURLOPT_RANGE again on every redirect it follows, so the
    // storage host behind the download endpoint still gets the Range header.
    const std::string range = fmt::format("{}-{}", first, last);
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, options_.max_redirects);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, options_.low_speed_limit);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.low_speed_time.count()));
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &detail::headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &detail::writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

    const CURLcode res = curl_easy_perform(curl.get());

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    result.http_status = code != 0 ? code : ctx.status;

    if (ctx.sink_stopped) {
        result.kind = TransferResult::Kind::Aborted;
        return result;
    }
    if (ctx.bad_status) {
        result.message = fmt::format("unexpected HTTP status {} for range {}", result.http_status, range);
        return result;
    }
    if (res != CURLE_OK) {
        result.message = fmt::format("curl error: {}", error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res));
        return result;
    }
    if (!detail::acceptsStatus(result.http_status, first)) {
        result.message = fmt::format("unexpected HTTP status {} for range {}", result.http_status, range);
        return result;
    }

    result.kind = TransferResult::Kind::Complete;
    return result;
}

} // namespace rangedl

#include "rangedl/remote_file.hpp"
#include "rangedl/detail/curl_utils.hpp"
#include "rangedl/detail/transfer_callbacks.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>

#include <curl/curl.h>

namespace rangedl {

RemoteMetadata probeRemoteFile(const std::string& url, const TransportOptions& options) {
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    detail::ensureCurlInitialized();

    RemoteMetadata meta;
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        return meta;
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, options.max_redirects);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout.count()));

    std::string headers;
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &detail::collectHeaders);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);

    if (curl_easy_perform(curl.get()) != CURLE_OK) {
        return meta;
    }

    meta.reachable = true;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &meta.http_status);

    std::string lowered(headers.size(), '\0');
    std::transform(headers.begin(), headers.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    meta.supports_range = meta.http_status == 206 || lowered.find("accept-ranges: bytes") != std::string::npos;

    curl_off_t length = -1;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    // -1 when the server sent no Content-Length.
    if (length >= 0) {
        meta.content_length = static_cast<std::uint64_t>(length);
    }
    if (meta.http_status < 200 || meta.http_status >= 300) {
        meta.supports_range = false;
    }
    return meta;
}

} // namespace rangedl

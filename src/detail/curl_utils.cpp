#include "rangedl/detail/curl_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

namespace rangedl::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            throw std::runtime_error(std::string{"Failed to initialize libcurl: "} + curl_easy_strerror(code));
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

std::string curlVersion() {
    const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
    return (info && info->version) ? info->version : "unknown";
}

} // namespace rangedl::detail

#include "rangedl/file_descriptor.hpp"
#include "rangedl/detail/curl_utils.hpp"

#include <memory>
#include <stdexcept>

#include <curl/curl.h>
#include <fmt/format.h>

namespace rangedl {

std::string makeDownloadUrl(const std::string& api_base, std::int64_t file_id, const std::string& token) {
    detail::ensureCurlInitialized();

    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw std::runtime_error("Failed to allocate curl handle");
    }

    std::unique_ptr<char, decltype(&curl_free)> escaped{
        curl_easy_escape(curl.get(), token.c_str(), static_cast<int>(token.size())), &curl_free};
    if (!escaped) {
        throw std::runtime_error("Failed to escape access token");
    }

    std::string base = api_base;
    if (!base.empty() && base.back() != '/') {
        base.push_back('/');
    }
    return fmt::format("{}files/{}/download?oauth_token={}", base, file_id, escaped.get());
}

} // namespace rangedl

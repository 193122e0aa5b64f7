#pragma once

#include <cstdint>
#include <string>

namespace rangedl {

inline constexpr const char* kDirectoryContentType = "application/x-directory";

// Identity of a remote file as reported by the source service's listing.
struct FileDescriptor {
    std::int64_t id{0};
    std::string name;
    std::string content_type;
    std::uint64_t size{0};
    std::string download_url;

    [[nodiscard]] bool isDirectory() const { return content_type == kDirectoryContentType; }
};

// <api_base>files/<id>/download?oauth_token=<token>
std::string makeDownloadUrl(const std::string& api_base, std::int64_t file_id, const std::string& token);

} // namespace rangedl

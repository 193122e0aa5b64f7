#include <catch2/catch.hpp>

#include "rangedl/file_descriptor.hpp"

using rangedl::FileDescriptor;

TEST_CASE("directories are recognized by content type") {
    FileDescriptor folder{1, "Movies", "application/x-directory", 0, {}};
    FileDescriptor video{2, "clip.mp4", "video/mp4", 1024, {}};
    CHECK(folder.isDirectory());
    CHECK_FALSE(video.isDirectory());
}

TEST_CASE("download urls carry the file id and an escaped token") {
    CHECK(rangedl::makeDownloadUrl("https://api.put.io/v2/", 42, "abc123")
          == "https://api.put.io/v2/files/42/download?oauth_token=abc123");
    CHECK(rangedl::makeDownloadUrl("https://api.put.io/v2", 7, "a b&c")
          == "https://api.put.io/v2/files/7/download?oauth_token=a%20b%26c");
}

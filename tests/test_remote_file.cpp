#include <catch2/catch.hpp>

#include "rangedl/remote_file.hpp"

#include <cstdint>
#include <optional>

using namespace rangedl;

namespace {

RemoteMetadata reply(bool ranges, std::optional<std::uint64_t> length) {
    RemoteMetadata meta;
    meta.reachable = true;
    meta.http_status = 200;
    meta.supports_range = ranges;
    meta.content_length = length;
    return meta;
}

} // namespace

TEST_CASE("a sized range-capable server is downloadable") {
    CHECK(reply(true, 1000000).downloadable());
}

TEST_CASE("a missing Content-Length is rejected") {
    CHECK_FALSE(reply(true, std::nullopt).downloadable());
    CHECK_FALSE(reply(false, std::nullopt).downloadable());
}

TEST_CASE("a server without ranges is rejected unless the file is empty") {
    CHECK_FALSE(reply(false, 1000000).downloadable());
    CHECK(reply(false, 0).downloadable());
    CHECK(reply(true, 0).downloadable());
}

TEST_CASE("an unreachable server is rejected") {
    RemoteMetadata meta;
    meta.content_length = 10;
    meta.supports_range = true;
    CHECK_FALSE(meta.downloadable());
}

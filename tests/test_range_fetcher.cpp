#include <catch2/catch.hpp>

#include "rangedl/download_job.hpp"
#include "rangedl/event_channel.hpp"
#include "rangedl/range_fetcher.hpp"

#include "fake_transport.hpp"
#include "temp_dir.hpp"

#include <string>

using namespace rangedl;
using rangedl::test::FakeTransport;
using rangedl::test::TempDir;
using rangedl::test::makePayload;
using rangedl::test::readFile;
using rangedl::test::testConfig;

namespace {

constexpr std::uint64_t kSize = 100000;

FileDescriptor makeFile(std::uint64_t size = kSize) {
    return FileDescriptor{9, "range.bin", "application/octet-stream", size, "http://example.invalid/range.bin"};
}

std::string payloadOf(const DownloadJob& job) {
    return readFile(job.tempPath()).substr(0, static_cast<std::size_t>(job.geometry().fileSize()));
}

} // namespace

TEST_CASE("a single range fills the file and marks every chunk") {
    TempDir dir;
    const auto config = testConfig();
    FakeTransport transport(makePayload(kSize), 1000);
    auto job = DownloadJob::open(makeFile(), dir.file("range.bin"), config);

    RangeFetcher fetcher(*job, transport, config);
    CHECK(fetcher.run({0, kSize}) == FetchStatus::Completed);

    CHECK(fetcher.bytesWritten() == kSize);
    CHECK(fetcher.attempts() == 1);
    CHECK_FALSE(job->firstMissingChunk().has_value());
    CHECK(payloadOf(*job) == transport.payload());

    const auto requests = transport.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].first == 0);
    CHECK(requests[0].last == kSize - 1);
    CHECK(requests[0].url == "http://example.invalid/range.bin");
}

TEST_CASE("a range ending mid-chunk leaves that chunk to its neighbour") {
    TempDir dir;
    const auto config = testConfig();
    FakeTransport transport(makePayload(kSize));
    auto job = DownloadJob::open(makeFile(), dir.file("range.bin"), config);

    // Chunk 1 spans [32768, 65536) and is shared by both halves.
    RangeFetcher lower(*job, transport, config);
    REQUIRE(lower.run({0, 50000}) == FetchStatus::Completed);
    auto bitmap = job->bitmapSnapshot();
    CHECK(bitmap.test(0));
    CHECK_FALSE(bitmap.test(1));
    CHECK_FALSE(bitmap.test(2));

    RangeFetcher upper(*job, transport, config);
    REQUIRE(upper.run({50000, 50000}) == FetchStatus::Completed);
    bitmap = job->bitmapSnapshot();
    CHECK(bitmap.test(1));
    CHECK(bitmap.test(2));
    CHECK(bitmap.test(3));
    CHECK(payloadOf(*job) == transport.payload());
}

TEST_CASE("the owner of a shared chunk's last byte cannot complete it alone") {
    TempDir dir;
    const auto config = testConfig();
    FakeTransport transport(makePayload(kSize));
    auto job = DownloadJob::open(makeFile(), dir.file("range.bin"), config);

    RangeFetcher upper(*job, transport, config);
    REQUIRE(upper.run({50000, 50000}) == FetchStatus::Completed);

    const auto bitmap = job->bitmapSnapshot();
    CHECK_FALSE(bitmap.test(0));
    CHECK_FALSE(bitmap.test(1));
    CHECK(bitmap.test(2));
    CHECK(bitmap.test(3));
}

TEST_CASE("a broken transfer is retried from the first missing byte") {
    TempDir dir;
    auto config = testConfig();
    config.max_retries = 2;
    FakeTransport transport(makePayload(kSize), 3000);
    transport.fail_once_after = 40000;
    auto job = DownloadJob::open(makeFile(), dir.file("range.bin"), config);

    RangeFetcher fetcher(*job, transport, config);
    CHECK(fetcher.run({0, kSize}) == FetchStatus::Completed);
    CHECK(fetcher.attempts() == 2);

    const auto requests = transport.requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[1].first == 40000);
    CHECK(requests[1].last == kSize - 1);
    CHECK(payloadOf(*job) == transport.payload());
    CHECK_FALSE(job->firstMissingChunk().has_value());
}

TEST_CASE("retries stop at the configured ceiling") {
    TempDir dir;
    auto config = testConfig();
    config.max_retries = 2;
    FakeTransport transport(makePayload(kSize));
    transport.cutoff = 0;
    auto job = DownloadJob::open(makeFile(), dir.file("range.bin"), config);

    RangeFetcher fetcher(*job, transport, config);
    CHECK(fetcher.run({0, kSize}) == FetchStatus::TransportFailed);
    CHECK(transport.requests().size() == 3);
    CHECK(job->bitmapSnapshot().countSet() == 0);
}

TEST_CASE("without retries a failed worker keeps what it received") {
    TempDir dir;
    const auto config = testConfig();
    FakeTransport transport(makePayload(kSize));
    transport.cutoff = 70000;
    auto job = DownloadJob::open(makeFile(), dir.file("range.bin"), config);

    RangeFetcher fetcher(*job, transport, config);
    CHECK(fetcher.run({0, kSize}) == FetchStatus::TransportFailed);
    CHECK(fetcher.bytesWritten() == 70000);
    CHECK(transport.requests().size() == 1);

    const auto bitmap = job->bitmapSnapshot();
    CHECK(bitmap.test(0));
    CHECK(bitmap.test(1));
    CHECK_FALSE(bitmap.test(2));
    CHECK(payloadOf(*job).substr(0, 70000) == transport.payload().substr(0, 70000));
}

TEST_CASE("a server ignoring the range only fills the assigned bytes") {
    TempDir dir;
    const auto config = testConfig();
    FakeTransport transport(makePayload(kSize));
    transport.ignore_range = true;
    auto job = DownloadJob::open(makeFile(), dir.file("range.bin"), config);

    RangeFetcher fetcher(*job, transport, config);
    CHECK(fetcher.run({0, 50000}) == FetchStatus::Completed);
    CHECK(fetcher.bytesWritten() == 50000);

    const auto payload = payloadOf(*job);
    CHECK(payload.substr(0, 50000) == transport.payload().substr(0, 50000));
    CHECK(payload.substr(50000) == std::string(50000, '\0'));
}

TEST_CASE("a cancelled job stops its workers") {
    TempDir dir;
    const auto config = testConfig();
    FakeTransport transport(makePayload(kSize));
    auto job = DownloadJob::open(makeFile(), dir.file("range.bin"), config);

    SECTION("before the first request") {
        job->cancel();
        RangeFetcher fetcher(*job, transport, config);
        CHECK(fetcher.run({0, kSize}) == FetchStatus::Cancelled);
        CHECK(transport.requests().empty());
    }

    SECTION("during a transfer") {
        transport.on_request = [&job]() { job->cancel(); };
        RangeFetcher fetcher(*job, transport, config);
        CHECK(fetcher.run({0, kSize}) == FetchStatus::Cancelled);
        CHECK(transport.requests().size() == 1);
        CHECK(job->bitmapSnapshot().countSet() == 0);
    }
}

TEST_CASE("workers report what they schedule and write") {
    TempDir dir;
    const auto config = testConfig();
    FakeTransport transport(makePayload(kSize), 7000);
    ProgressChannel events(1024);
    auto job = DownloadJob::open(makeFile(), dir.file("range.bin"), config);

    RangeFetcher fetcher(*job, transport, config, &events);
    REQUIRE(fetcher.run({20000, 60000}) == FetchStatus::Completed);
    events.close();

    auto first = events.pop();
    REQUIRE(first);
    CHECK(first->kind == ProgressEvent::Kind::Scheduled);
    CHECK(first->bytes == 60000);
    CHECK(first->file == "range.bin");

    std::uint64_t downloaded = 0;
    while (auto event = events.pop()) {
        CHECK(event->kind == ProgressEvent::Kind::Downloaded);
        CHECK(event->bytes <= config.chunk_size);
        downloaded += event->bytes;
    }
    CHECK(downloaded == 60000);
}

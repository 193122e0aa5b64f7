#include <catch2/catch.hpp>

#include "rangedl/download_job.hpp"
#include "rangedl/errors.hpp"

#include "temp_dir.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

using namespace rangedl;
using rangedl::test::TempDir;
using rangedl::test::readFile;
using rangedl::test::testConfig;
using rangedl::test::writeFile;

namespace {

FileDescriptor makeFile(std::uint64_t size) {
    return FileDescriptor{1, "sample.bin", "application/octet-stream", size, "http://example.invalid/sample.bin"};
}

} // namespace

TEST_CASE("a new job allocates payload plus a zeroed bitmap") {
    TempDir dir;
    const auto dest = dir.file("sample.bin");
    auto job = DownloadJob::open(makeFile(100000), dest, testConfig());

    CHECK(job->state() == JobState::Fresh);
    CHECK_FALSE(job->resuming());
    CHECK(job->tempPath() == dest + ".ptdownload");

    const auto bytes = readFile(job->tempPath());
    REQUIRE(bytes.size() == 100000 + 1);
    CHECK(bytes == std::string(bytes.size(), '\0'));
}

TEST_CASE("completed chunks are persisted after the payload") {
    TempDir dir;
    auto job = DownloadJob::open(makeFile(100000), dir.file("sample.bin"), testConfig());

    CHECK(job->creditChunk(0, 32768));
    CHECK(job->creditChunk(3, 1696)); // last chunk is short
    CHECK_FALSE(job->creditChunk(0, 32768));

    const auto bytes = readFile(job->tempPath());
    REQUIRE(bytes.size() == 100001);
    CHECK(static_cast<unsigned char>(bytes[100000]) == 0x90);
    CHECK(job->firstMissingChunk() == std::optional<std::uint64_t>(1));
}

TEST_CASE("a shared chunk completes only when every share is credited") {
    TempDir dir;
    auto job = DownloadJob::open(makeFile(100000), dir.file("sample.bin"), testConfig());

    CHECK_FALSE(job->creditChunk(1, 17232));
    CHECK_FALSE(job->bitmapSnapshot().test(1));
    CHECK(job->creditChunk(1, 15536));
    CHECK(job->bitmapSnapshot().test(1));
}

TEST_CASE("reopening an existing temp file resumes its progress") {
    TempDir dir;
    const auto dest = dir.file("sample.bin");
    {
        auto job = DownloadJob::open(makeFile(100000), dest, testConfig());
        job->creditChunk(0, 32768);
        job->creditChunk(2, 32768);
        job->release();
    }

    auto job = DownloadJob::open(makeFile(100000), dest, testConfig());
    CHECK(job->resuming());
    CHECK(job->state() == JobState::Resuming);
    const auto bitmap = job->bitmapSnapshot();
    CHECK(bitmap.test(0));
    CHECK_FALSE(bitmap.test(1));
    CHECK(bitmap.test(2));
    CHECK_FALSE(bitmap.test(3));
}

TEST_CASE("a temp file of the wrong length starts over") {
    TempDir dir;
    const auto dest = dir.file("sample.bin");
    writeFile(dest + ".ptdownload", std::string(5000, '\xff'));

    auto job = DownloadJob::open(makeFile(100000), dest, testConfig());
    CHECK_FALSE(job->resuming());
    CHECK(job->bitmapSnapshot().countSet() == 0);
    CHECK(std::filesystem::file_size(job->tempPath()) == 100001);
}

TEST_CASE("an unusable destination is a setup error") {
    TempDir dir;
    try {
        DownloadJob::open(makeFile(100), dir.file("missing/sample.bin"), testConfig());
        FAIL("open() should have thrown");
    } catch (const DownloadError& ex) {
        CHECK(ex.kind() == ErrorKind::Setup);
    }
}

TEST_CASE("finalize truncates and renames onto the destination") {
    TempDir dir;
    const auto dest = dir.file("sample.bin");
    auto job = DownloadJob::open(makeFile(100000), dest, testConfig());
    const std::string data(100000, 'x');
    job->writeAt(data.data(), data.size(), 0);

    job->finalize();

    CHECK(job->state() == JobState::Finalized);
    CHECK_FALSE(std::filesystem::exists(dest + ".ptdownload"));
    CHECK(readFile(dest) == data);
}

TEST_CASE("a failed rename keeps the progress for the next run") {
    TempDir dir;
    const auto dest = dir.file("sample.bin");
    std::filesystem::create_directories(std::filesystem::path(dest) / "occupied");

    auto job = DownloadJob::open(makeFile(100000), dest, testConfig());
    job->creditChunk(1, 32768);

    try {
        job->finalize();
        FAIL("finalize() should have thrown");
    } catch (const DownloadError& ex) {
        CHECK(ex.kind() == ErrorKind::Finalize);
    }
    CHECK(job->state() == JobState::Failed);
    REQUIRE(std::filesystem::file_size(dest + ".ptdownload") == 100001);
    CHECK(static_cast<unsigned char>(readFile(dest + ".ptdownload")[100000]) == 0x40);
}

TEST_CASE("writes past the payload are refused") {
    TempDir dir;
    auto job = DownloadJob::open(makeFile(1000), dir.file("sample.bin"), testConfig());
    const std::string data(10, 'x');
    CHECK_THROWS_AS(job->writeAt(data.data(), data.size(), 995), std::system_error);
}

TEST_CASE("the temp path names any non-default chunk size") {
    CHECK(tempPathFor("/data/a.bin", testConfig()) == "/data/a.bin.ptdownload");
    CHECK(tempPathFor("/data/a.bin", testConfig(65536)) == "/data/a.bin.65536.ptdownload");

    TempDir dir;
    const auto dest = dir.file("sample.bin");
    auto job = DownloadJob::open(makeFile(100000), dest, testConfig(65536));
    CHECK(job->tempPath() == dest + ".65536.ptdownload");
    CHECK(std::filesystem::exists(dest + ".65536.ptdownload"));
    CHECK_FALSE(std::filesystem::exists(dest + ".ptdownload"));
}

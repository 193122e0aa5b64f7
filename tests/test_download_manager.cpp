#include <catch2/catch.hpp>

#include "rangedl/download_manager.hpp"

#include "fake_transport.hpp"
#include "temp_dir.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>

using namespace rangedl;
using rangedl::test::FakeTransport;
using rangedl::test::TempDir;
using rangedl::test::makePayload;
using rangedl::test::readFile;
using rangedl::test::testConfig;

namespace {

FileDescriptor makeFile(std::int64_t id, const std::string& name, std::uint64_t size) {
    return FileDescriptor{id, name, "application/octet-stream", size, "http://example.invalid/" + name};
}

} // namespace

TEST_CASE("the manager downloads every task") {
    TempDir dir;
    auto transport = std::make_shared<FakeTransport>(makePayload(120000));
    DownloadManager manager(testConfig(32768, 3), transport, false);
    manager.addTask(makeFile(1, "a.bin", 120000), dir.file("a.bin"));
    manager.addTask(makeFile(2, "b.bin", 50000), dir.file("b.bin"));

    manager.start();

    CHECK_FALSE(manager.hasErrors());
    REQUIRE(manager.tasks().size() == 2);
    for (const auto& task : manager.tasks()) {
        REQUIRE(task.outcome.has_value());
        CHECK(*task.outcome == JobOutcome::Finalized);
    }
    CHECK(readFile(dir.file("a.bin")) == transport->payload());
    CHECK(readFile(dir.file("b.bin")) == transport->payload().substr(0, 50000));
}

TEST_CASE("one failing task does not stop the others") {
    TempDir dir;
    auto transport = std::make_shared<FakeTransport>(makePayload(80000));
    DownloadManager manager(testConfig(32768, 2), transport, false);
    manager.addTask(makeFile(1, "good.bin", 80000), dir.file("good.bin"));
    manager.addTask(makeFile(2, "bad.bin", 80000), dir.file("missing/bad.bin"));

    manager.start();

    CHECK(manager.hasErrors());
    CHECK(*manager.tasks()[0].outcome == JobOutcome::Finalized);
    CHECK(*manager.tasks()[1].outcome == JobOutcome::Failed);
    CHECK(std::filesystem::exists(dir.file("good.bin")));

    std::ostringstream out;
    manager.printErrors(out);
    CHECK(out.str().find("missing/bad.bin: setup error") != std::string::npos);
    CHECK(out.str().find("good.bin:") == std::string::npos);
}

#include <catch2/catch.hpp>

#include "rangedl/event_channel.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using rangedl::EventChannel;

TEST_CASE("values come out in push order") {
    EventChannel<int> channel(8);
    for (int i = 0; i < 5; ++i) {
        REQUIRE(channel.tryPush(i));
    }
    for (int i = 0; i < 5; ++i) {
        auto value = channel.tryPop();
        REQUIRE(value);
        CHECK(*value == i);
    }
    CHECK_FALSE(channel.tryPop().has_value());
}

TEST_CASE("a full channel drops instead of blocking") {
    EventChannel<int> channel(2);
    CHECK(channel.tryPush(1));
    CHECK(channel.tryPush(2));
    CHECK_FALSE(channel.tryPush(3));
    CHECK_FALSE(channel.tryPush(4));
    CHECK(channel.dropped() == 2);
    CHECK(channel.size() == 2);
}

TEST_CASE("a closed channel drains then reports the end") {
    EventChannel<int> channel(4);
    channel.tryPush(7);
    channel.close();
    CHECK_FALSE(channel.tryPush(8));

    auto first = channel.pop();
    REQUIRE(first);
    CHECK(*first == 7);
    CHECK_FALSE(channel.pop().has_value());
    CHECK(channel.isClosed());
}

TEST_CASE("pop waits for a producer") {
    EventChannel<int> channel(4);
    std::thread producer([&channel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.tryPush(42);
    });
    auto value = channel.pop();
    producer.join();
    REQUIRE(value);
    CHECK(*value == 42);
}

TEST_CASE("concurrent producers lose nothing while there is room") {
    EventChannel<int> channel(10000);
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&channel]() {
            for (int i = 0; i < 1000; ++i) {
                channel.tryPush(1);
            }
        });
    }

    std::atomic<int> received{0};
    std::thread consumer([&]() {
        while (auto value = channel.pop()) {
            received += *value;
        }
    });

    for (auto& producer : producers) {
        producer.join();
    }
    channel.close();
    consumer.join();

    CHECK(received.load() == 4000);
    CHECK(channel.dropped() == 0);
}

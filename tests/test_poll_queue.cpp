#include <doctest/doctest.h>
#include "gaugelink/continuous_poller.hpp"
#include "gaugelink/poll_queue.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace gaugelink;
using namespace std::chrono_literals;

static DeviceResponse numbered(int i) {
    return DeviceResponse::ok(Bytes{static_cast<uint8_t>(i)}, std::to_string(i));
}

TEST_CASE("A full queue drops the oldest response") {
    PollQueue<3> q;
    for (int i = 0; i < 5; ++i) q.push(numbered(i));
    CHECK(q.size() == 3);
    CHECK(q.dropped() == 2);

    DeviceResponse r;
    REQUIRE(q.try_pop(r));
    CHECK(r.formatted == "2");
}

TEST_CASE("pop_for gives up after the wait") {
    PollQueue<4> q;
    DeviceResponse r;
    const auto t0 = std::chrono::steady_clock::now();
    CHECK_FALSE(q.pop_for(r, 30ms));
    CHECK(std::chrono::steady_clock::now() - t0 >= 25ms);

    std::thread producer([&q] {
        std::this_thread::sleep_for(10ms);
        q.push(numbered(9));
    });
    CHECK(q.pop_for(r, 1000ms));
    CHECK(r.formatted == "9");
    producer.join();
}

TEST_CASE("The poller runs the step at the interval and stops in time") {
    ContinuousPoller poller;
    PollQueue<64> q;
    std::atomic<int> steps{0};

    REQUIRE(poller.start(5ms, [&] { return numbered(++steps); }, [&](const DeviceResponse& r) { q.push(r); }));
    CHECK(poller.running());
    CHECK_FALSE(poller.start(5ms, [] { return DeviceResponse{}; }, [](const DeviceResponse&) {}));

    DeviceResponse first;
    REQUIRE(q.pop_for(first, 1000ms));
    CHECK(first.formatted == "1");

    CHECK(poller.stop(500ms));
    CHECK_FALSE(poller.running());
    const std::size_t delivered = poller.deliveries();
    std::this_thread::sleep_for(20ms);
    CHECK(poller.deliveries() == delivered);
}

TEST_CASE("A throwing sink does not end the loop") {
    ContinuousPoller poller;
    std::atomic<int> calls{0};
    REQUIRE(poller.start(1ms, [] { return numbered(1); }, [&](const DeviceResponse&) {
        ++calls;
        throw std::runtime_error("sink broke");
    }));
    std::this_thread::sleep_for(30ms);
    CHECK(poller.stop(500ms));
    CHECK(calls.load() > 1);
}

TEST_CASE("Stopping an idle poller is a no-op") {
    ContinuousPoller poller;
    CHECK(poller.stop(0ms));
    CHECK_FALSE(poller.start(5ms, nullptr, [](const DeviceResponse&) {}));
}

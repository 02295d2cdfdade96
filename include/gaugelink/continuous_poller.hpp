#pragma once
/**
 * @file continuous_poller.hpp
 * @brief Cancellable background loop: run one step, deliver its result, sleep, repeat.
 *
 * @details
 * PURPOSE
 * -------
 * Both the serial transport and the simulator poll the same way, so the
 * loop lives here and each link only supplies the step ("send the
 * continuous command" or "receive one streamed frame").
 *
 * CONTRACT
 * --------
 * - Every step result is delivered to the sink, failures included. A failed
 *   read never ends the loop.
 * - The cancel flag is checked before each step and before each sleep. The
 *   sleep waits on a condition variable, so stop() does not have to wait out
 *   the interval.
 * - stop() waits up to @p grace for the loop to notice, logs a warning when
 *   it takes longer, and then joins in any case. When stop() returns the
 *   worker has exited and the sink will not be called again.
 * - The worst case for stop() is one interval plus one read timeout.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

#include "gaugelink/types.hpp"

namespace gaugelink {

using ResponseSink = std::function<void(const DeviceResponse&)>;

class ContinuousPoller {
public:
    using Step = std::function<DeviceResponse()>;

    ContinuousPoller() = default;
    ~ContinuousPoller() { stop(std::chrono::milliseconds(0)); }

    ContinuousPoller(const ContinuousPoller&) = delete;
    ContinuousPoller& operator=(const ContinuousPoller&) = delete;

    /// false when a loop is already running.
    bool start(std::chrono::milliseconds interval, Step step, ResponseSink sink);

    /// true when the loop exited within @p grace (or was not running).
    bool stop(std::chrono::milliseconds grace);

    bool running() const { return running_.load(); }

    /// Number of results delivered since the last start().
    std::size_t deliveries() const { return deliveries_.load(); }

private:
    void run();

    std::chrono::milliseconds interval_{1000};
    Step step_;
    ResponseSink sink_;

    std::thread worker_;
    std::atomic<bool> cancel_{false};
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> deliveries_{0};

    std::mutex m_;
    std::condition_variable cv_;
    bool finished_{false};
};

} // namespace gaugelink

#pragma once
/**
 * @file poll_queue.hpp
 * @brief Bounded hand-off of polling results from the worker thread to a consumer.
 *
 * @details
 * Fixed capacity, no heap growth: the storage is an etl::deque sized at
 * compile time, the same container the message core used for its inbox and
 * outbox. When the consumer falls behind, the oldest reading is dropped so
 * the newest one is always available; dropped() counts how many were lost.
 *
 * push() is meant to be used as the sink of start_continuous():
 * @code
 *   gaugelink::PollQueue<> q;
 *   link->start_continuous(interval, [&q](const gaugelink::DeviceResponse& r) { q.push(r); });
 *   gaugelink::DeviceResponse r;
 *   while (q.pop_for(r, std::chrono::seconds(1))) { ... }
 * @endcode
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

#include <etl/deque.h>

#include "gaugelink/types.hpp"

namespace gaugelink {

template <std::size_t Capacity = 64>
class PollQueue {
public:
    static_assert(Capacity > 0, "PollQueue needs room for at least one response");

    void push(const DeviceResponse& r) {
        {
            std::lock_guard<std::mutex> lock(m_);
            if (items_.full()) {
                items_.pop_front();
                ++dropped_;
            }
            items_.push_back(r);
        }
        cv_.notify_one();
    }

    /// Non-blocking; false when empty.
    bool try_pop(DeviceResponse& out) {
        std::lock_guard<std::mutex> lock(m_);
        if (items_.empty()) return false;
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    /// Wait up to @p wait for a response; false on timeout.
    bool pop_for(DeviceResponse& out, std::chrono::milliseconds wait) {
        std::unique_lock<std::mutex> lock(m_);
        if (!cv_.wait_for(lock, wait, [this] { return !items_.empty(); })) return false;
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_);
        return items_.size();
    }

    std::size_t dropped() const {
        std::lock_guard<std::mutex> lock(m_);
        return dropped_;
    }

    static constexpr std::size_t capacity() { return Capacity; }

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    etl::deque<DeviceResponse, Capacity> items_;
    std::size_t dropped_{0};
};

} // namespace gaugelink

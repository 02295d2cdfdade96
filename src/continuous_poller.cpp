// ============================================================================
// continuous_poller.cpp - implementation for continuous_poller.hpp
// ============================================================================

#include "gaugelink/continuous_poller.hpp"
#include "gaugelink/log.hpp"

#include <exception>

namespace gaugelink {

bool ContinuousPoller::start(std::chrono::milliseconds interval, Step step, ResponseSink sink) {
    if (running_.load() || worker_.joinable()) return false;
    if (!step || !sink) return false;

    interval_ = interval;
    step_ = std::move(step);
    sink_ = std::move(sink);
    cancel_.store(false);
    deliveries_.store(0);
    {
        std::lock_guard<std::mutex> lock(m_);
        finished_ = false;
    }

    running_.store(true);
    worker_ = std::thread(&ContinuousPoller::run, this);
    log::debug("poll_start", {{"interval_ms", std::to_string(interval.count())}});
    return true;
}

// ---------------------------------------------------------------------------
// run()
// -----
// Exceptions thrown by the sink are logged; the loop carries on with the
// next reading.
// ---------------------------------------------------------------------------
void ContinuousPoller::run() {
    while (!cancel_.load()) {
        DeviceResponse r = step_();
        if (cancel_.load()) break;

        try {
            sink_(r);
        } catch (const std::exception& e) {
            log::error("poll_sink_failed", {{"what", e.what()}});
        }
        deliveries_.fetch_add(1);

        if (cancel_.load()) break;
        std::unique_lock<std::mutex> lock(m_);
        cv_.wait_for(lock, interval_, [this] { return cancel_.load(); });
    }

    {
        std::lock_guard<std::mutex> lock(m_);
        finished_ = true;
    }
    cv_.notify_all();
}

bool ContinuousPoller::stop(std::chrono::milliseconds grace) {
    if (!worker_.joinable()) {
        running_.store(false);
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(m_);
        cancel_.store(true);
    }
    cv_.notify_all();

    bool in_time = false;
    {
        std::unique_lock<std::mutex> lock(m_);
        in_time = cv_.wait_for(lock, grace, [this] { return finished_; });
    }
    if (!in_time) {
        log::warn("poll_stop_overrun", {{"grace_ms", std::to_string(grace.count())}});
    }

    worker_.join();
    running_.store(false);
    step_ = nullptr;
    sink_ = nullptr;
    log::debug("poll_stop", {{"deliveries", std::to_string(deliveries_.load())}});
    return in_time;
}

} // namespace gaugelink

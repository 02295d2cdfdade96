#pragma once
/**
 * @file fake_serial_port.hpp
 * @brief Scripted ISerialPort for frame reader and transport tests.
 *
 * Each write() releases the next scripted reply (or asks the responder).
 * A reply is a list of chunks; a chunk becomes readable @c after its
 * predecessor, which is how idle gaps and slow NAK tails are modelled.
 * Everything the link does to the line is appended to @c events:
 *   "open:<baud>", "close", "discard", "rts:0|1", "dtr:0|1", "write".
 */

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "gaugelink/transport/transport_base.hpp"
#include "gaugelink/types.hpp"

namespace gaugelink::testing {

class FakeSerialPort : public transport::ISerialPort {
public:
    using Clock = std::chrono::steady_clock;

    struct Chunk {
        Bytes bytes;
        std::chrono::milliseconds after{0};
    };
    using Reply = std::vector<Chunk>;

    /// Reply to the next write.
    void script(Reply r) {
        std::lock_guard<std::mutex> lock(m_);
        replies_.push_back(std::move(r));
    }

    void script(const Bytes& b) { script(Reply{Chunk{b, std::chrono::milliseconds(0)}}); }

    void script(const std::string& s) { script(Bytes(s.begin(), s.end())); }

    /// Bytes readable right away, without a write.
    void feed(const Bytes& b, std::chrono::milliseconds after = std::chrono::milliseconds(0)) {
        std::lock_guard<std::mutex> lock(m_);
        schedule(Reply{Chunk{b, after}});
    }

    /// Computes replies from the written frame; scripted replies are ignored while set.
    std::function<Reply(const Bytes& written, int baud)> responder;

    bool fail_open{false};

    bool open(const transport::PortConfig& cfg, std::string& err) override {
        std::lock_guard<std::mutex> lock(m_);
        if (fail_open) { err = "open failed: " + cfg.path; return false; }
        open_ = true;
        baud_ = cfg.serial.baud;
        bauds_.push_back(baud_);
        events_.push_back("open:" + std::to_string(baud_));
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(m_);
        if (open_) events_.push_back("close");
        open_ = false;
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(m_);
        return open_;
    }

    transport::TxResult write(const uint8_t* data, std::size_t len) override {
        std::lock_guard<std::mutex> lock(m_);
        Bytes frame(data, data + len);
        writes_.push_back(frame);
        events_.push_back("write");
        if (responder) {
            schedule(responder(frame, baud_));
        } else if (!replies_.empty()) {
            schedule(replies_.front());
            replies_.pop_front();
        }
        return transport::TxResult::Ok;
    }

    transport::RxResult read(uint8_t* out, std::size_t cap, std::size_t& out_len,
                             std::chrono::milliseconds wait) override {
        out_len = 0;
        if (cap == 0) return transport::RxResult::None;
        const auto until = Clock::now() + wait;
        while (true) {
            {
                std::lock_guard<std::mutex> lock(m_);
                if (!rx_.empty() && rx_.front().first <= Clock::now()) {
                    out[0] = rx_.front().second;
                    rx_.pop_front();
                    out_len = 1;
                    return transport::RxResult::Ok;
                }
            }
            if (Clock::now() >= until) return transport::RxResult::None;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void discard_input() override {
        std::lock_guard<std::mutex> lock(m_);
        events_.push_back("discard");
        rx_.clear();
    }

    bool set_rts(bool level) override {
        std::lock_guard<std::mutex> lock(m_);
        events_.push_back(std::string("rts:") + (level ? "1" : "0"));
        return true;
    }

    bool set_dtr(bool level) override {
        std::lock_guard<std::mutex> lock(m_);
        events_.push_back(std::string("dtr:") + (level ? "1" : "0"));
        return true;
    }

    const char* name() const override { return "fake"; }

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(m_);
        return events_;
    }

    std::vector<Bytes> writes() const {
        std::lock_guard<std::mutex> lock(m_);
        return writes_;
    }

    std::vector<int> bauds() const {
        std::lock_guard<std::mutex> lock(m_);
        return bauds_;
    }

    void clear_events() {
        std::lock_guard<std::mutex> lock(m_);
        events_.clear();
    }

private:
    void schedule(const Reply& r) {
        auto at = Clock::now();
        for (const auto& c : r) {
            at += c.after;
            for (uint8_t b : c.bytes) rx_.emplace_back(at, b);
        }
    }

    mutable std::mutex m_;
    std::deque<Reply> replies_;
    std::deque<std::pair<Clock::time_point, uint8_t>> rx_;
    std::vector<Bytes> writes_;
    std::vector<std::string> events_;
    std::vector<int> bauds_;
    bool open_{false};
    int baud_{0};
};

inline Bytes bytes_of(const std::string& s) { return Bytes(s.begin(), s.end()); }

} // namespace gaugelink::testing

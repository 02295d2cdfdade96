// ============================================================================
// frame_reader.cpp - implementation for frame_reader.hpp
// ============================================================================

#include "gaugelink/frame_reader.hpp"
#include "gaugelink/transport/transport_base.hpp"

#include <algorithm>

namespace gaugelink {

namespace {

bool ends_with(const Bytes& buf, const std::string& tail) {
    if (tail.empty() || buf.size() < tail.size()) return false;
    return std::equal(tail.begin(), tail.end(), buf.end() - static_cast<std::ptrdiff_t>(tail.size()),
                      [](char c, uint8_t b) { return static_cast<uint8_t>(c) == b; });
}

bool starts_with(const Bytes& buf, const std::string& head) {
    if (head.empty() || buf.size() < head.size()) return false;
    return std::equal(head.begin(), head.end(), buf.begin(),
                      [](char c, uint8_t b) { return static_cast<uint8_t>(c) == b; });
}

// starts_with() that lets up to @p digits address digits sit after the
// marker's first character.
bool starts_with_marker(const Bytes& buf, const std::string& marker, std::size_t digits) {
    if (digits == 0 || marker.size() < 2) return starts_with(buf, marker);
    if (buf.empty() || buf[0] != static_cast<uint8_t>(marker[0])) return false;

    std::size_t pos = 1;
    while (pos < buf.size() && pos <= digits && buf[pos] >= '0' && buf[pos] <= '9') ++pos;

    const std::size_t rest = marker.size() - 1;
    if (buf.size() - pos < rest) return false;
    return std::equal(marker.begin() + 1, marker.end(), buf.begin() + static_cast<std::ptrdiff_t>(pos),
                      [](char c, uint8_t b) { return static_cast<uint8_t>(c) == b; });
}

} // namespace

const char* read_status_name(ReadStatus s) {
    switch (s) {
        case ReadStatus::Complete: return "complete";
        case ReadStatus::Partial:  return "partial";
        case ReadStatus::Timeout:  return "timeout";
        case ReadStatus::Error:    return "error";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// next_byte()
// -----------
// One byte at a time, like the SLIP reader this grew out of: low throughput,
// but frame boundaries are never overrun into the next reply.
// ---------------------------------------------------------------------------
int FrameReader::next_byte(uint8_t& b, std::chrono::milliseconds wait) {
    std::size_t got = 0;
    transport::RxResult r = port_.read(&b, 1, got, wait);
    if (r == transport::RxResult::Error) return -1;
    return (r == transport::RxResult::Ok && got == 1) ? 1 : 0;
}

std::chrono::milliseconds FrameReader::remaining(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

// ---------------------------------------------------------------------------
// read_fixed_frame()
// ------------------
// Drop bytes until the sync byte, then collect length-1 more. A frame that
// does not complete before the deadline is a timeout; the fragment is not
// returned because a capacitance frame without its checksum byte is useless.
// ---------------------------------------------------------------------------
ReadResult FrameReader::read_fixed_frame(uint8_t sync_byte, std::size_t length,
                                         std::chrono::milliseconds timeout) {
    ReadResult res;
    if (length == 0) return res;

    const auto deadline = Clock::now() + timeout;
    Bytes frame;
    frame.reserve(length);

    while (true) {
        auto left = remaining(deadline);
        if (left.count() == 0) return res;                    // Timeout

        uint8_t b = 0;
        int r = next_byte(b, left);
        if (r < 0) { res.status = ReadStatus::Error; return res; }
        if (r == 0) continue;

        if (frame.empty() && b != sync_byte) continue;        // garbage before sync
        frame.push_back(b);
        if (frame.size() == length) {
            res.status = ReadStatus::Complete;
            res.bytes = std::move(frame);
            return res;
        }
    }
}

// ---------------------------------------------------------------------------
// read_until_terminator()
// -----------------------
// Accumulate until the tail matches the terminator. Once the buffer starts
// with the NAK marker, addressed or not, only the NAK terminator ends the
// frame and an idle gap does not; the deadline still bounds the wait.
// ---------------------------------------------------------------------------
ReadResult FrameReader::read_until_terminator(const std::string& terminator,
                                              std::chrono::milliseconds timeout,
                                              const std::string& nak_marker,
                                              const std::string& nak_terminator,
                                              std::size_t marker_address_digits) {
    ReadResult res;
    const auto deadline = Clock::now() + timeout;
    const std::string& nak_end = nak_terminator.empty() ? terminator : nak_terminator;
    bool in_nak = false;
    Bytes buf;

    auto give_back = [&](ReadStatus when_data, ReadStatus when_empty) {
        res.status = buf.empty() ? when_empty : when_data;
        res.bytes = std::move(buf);
        return res;
    };

    while (true) {
        auto left = remaining(deadline);
        if (left.count() == 0) return give_back(ReadStatus::Partial, ReadStatus::Timeout);

        auto wait = (buf.empty() || in_nak) ? left : std::min(left, idle_gap_);
        uint8_t b = 0;
        int r = next_byte(b, wait);
        if (r < 0) return give_back(ReadStatus::Partial, ReadStatus::Error);
        if (r == 0) {
            if (!buf.empty() && !in_nak) return give_back(ReadStatus::Partial, ReadStatus::Timeout);
            continue;
        }

        buf.push_back(b);
        if (!in_nak && starts_with_marker(buf, nak_marker, marker_address_digits)) in_nak = true;

        if (ends_with(buf, in_nak ? nak_end : terminator))
            return give_back(ReadStatus::Complete, ReadStatus::Timeout);
    }
}

// ---------------------------------------------------------------------------
// read_until_idle()
// -----------------
// Everything that arrives until the first quiet gap after the first byte.
// ---------------------------------------------------------------------------
ReadResult FrameReader::read_until_idle(std::chrono::milliseconds timeout) {
    ReadResult res;
    const auto deadline = Clock::now() + timeout;
    Bytes buf;

    while (true) {
        auto left = remaining(deadline);
        if (left.count() == 0) break;

        auto wait = buf.empty() ? left : std::min(left, idle_gap_);
        uint8_t b = 0;
        int r = next_byte(b, wait);
        if (r < 0) {
            if (buf.empty()) { res.status = ReadStatus::Error; return res; }
            break;
        }
        if (r == 0) {
            if (!buf.empty()) break;
            continue;
        }
        buf.push_back(b);
    }

    res.status = buf.empty() ? ReadStatus::Timeout : ReadStatus::Complete;
    res.bytes = std::move(buf);
    return res;
}

ReadResult FrameReader::read(const ReadSpec& spec, std::chrono::milliseconds timeout) {
    switch (spec.strategy) {
        case ReadStrategy::FixedFrame:
            return read_fixed_frame(spec.sync_byte, spec.frame_length, timeout);
        case ReadStrategy::Terminator:
            return read_until_terminator(spec.terminator, timeout, spec.nak_marker, spec.nak_terminator,
                                         spec.marker_address_digits);
        case ReadStrategy::Idle:
            break;
    }
    return read_until_idle(timeout);
}

} // namespace gaugelink

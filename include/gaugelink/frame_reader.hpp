#pragma once
/**
 * @file frame_reader.hpp
 * @brief Read strategies that recognise one complete inbound frame under a deadline.
 *
 * @details
 * PURPOSE
 * -------
 * The supported protocols end their frames in three different ways, so the
 * transport needs three ways of deciding "this is the whole answer":
 *
 * - read_fixed_frame(): capacitance gauges send 9-byte frames that start with
 *   a sync byte (0x07). Anything before the sync byte is line noise or the
 *   tail of an earlier frame and is dropped.
 * - read_until_terminator(): ASCII protocols end with a terminator (`\`,
 *   `\r`). A NAK reply may carry its own terminator, so once the buffer starts
 *   with the NAK marker (optionally with an address between its first
 *   character and the rest) only the NAK terminator ends it.
 * - read_until_idle(): Pfeiffer binary replies carry no end marker; the frame
 *   is whatever arrives before the line goes quiet.
 *
 * CONTRACT
 * --------
 * - No strategy blocks past its timeout, including on a silent line.
 * - No strategy throws for the no-data case. Each returns a ReadResult that
 *   either holds bytes (Complete or Partial) or says Timeout / Error with no
 *   bytes.
 * - The terminator strategy hands back what it has when the line goes idle
 *   without a terminator (Partial), so a garbled reply can still reach the
 *   codec and fail with a descriptive message instead of a bare timeout.
 *
 * "Idle" means no byte arrived for @c idle_gap after at least one byte did.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "gaugelink/types.hpp"

namespace gaugelink {

namespace transport { class ISerialPort; }

enum class ReadStrategy : uint8_t { FixedFrame = 0, Terminator, Idle };

/// How a codec's replies end. Produced by ProtocolCodec::read_spec().
struct ReadSpec {
    ReadStrategy strategy{ReadStrategy::Idle};
    uint8_t sync_byte{0};
    std::size_t frame_length{0};
    std::string terminator;
    std::string nak_marker;
    std::string nak_terminator;
    /// Up to this many address digits may follow the marker's first
    /// character ("@254NAK" matches "@NAK" with 3).
    std::size_t marker_address_digits{0};
};

enum class ReadStatus : uint8_t {
    Complete = 0,   ///< frame recognised by its sync/terminator/idle rule
    Partial,        ///< bytes arrived but the line went idle before a terminator
    Timeout,        ///< nothing usable before the deadline
    Error           ///< port read failed
};

struct ReadResult {
    ReadStatus status{ReadStatus::Timeout};
    Bytes bytes;

    bool received() const { return !bytes.empty(); }
};

const char* read_status_name(ReadStatus s);

class FrameReader {
public:
    explicit FrameReader(transport::ISerialPort& port,
                         std::chrono::milliseconds idle_gap = std::chrono::milliseconds(20))
    : port_(port), idle_gap_(idle_gap) {}

    ReadResult read_fixed_frame(uint8_t sync_byte, std::size_t length, std::chrono::milliseconds timeout);

    ReadResult read_until_terminator(const std::string& terminator, std::chrono::milliseconds timeout,
                                     const std::string& nak_marker = {},
                                     const std::string& nak_terminator = {},
                                     std::size_t marker_address_digits = 0);

    ReadResult read_until_idle(std::chrono::milliseconds timeout);

    /// Dispatch on @p spec.strategy.
    ReadResult read(const ReadSpec& spec, std::chrono::milliseconds timeout);

private:
    using Clock = std::chrono::steady_clock;

    // One byte, waiting at most @p wait. 1 = got a byte, 0 = nothing, -1 = error.
    int next_byte(uint8_t& b, std::chrono::milliseconds wait);

    static std::chrono::milliseconds remaining(Clock::time_point deadline);

    transport::ISerialPort& port_;
    std::chrono::milliseconds idle_gap_;
};

} // namespace gaugelink

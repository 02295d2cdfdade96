#pragma once
/**
 * @file capacitance_codec.hpp
 * @brief INFICON-style capacitance diaphragm gauge frames (5-byte request, 9-byte reply).
 *
 * @details
 * Request : [0x03, service, address, data, sum(bytes 1..3) & 0xFF]
 * Reply   : [0x07, page, status, error, p_hi, p_lo, read_value, sensor_type, sum(bytes 1..7) & 0xFF]
 *
 * The reply does not say which register it answers, so decode() relies on
 * the ResponseHint produced by encode(). Without a hint the reply is shown as
 * a hex dump.
 *
 * Pressure is a signed 16-bit value with 14 fractional bits (raw / 16384).
 *
 * Status byte:
 *   bit7  heating
 *   bit6  temperature ok
 *   bit5  emission on
 *   bits 5:4 unit (0 mbar, 1 Torr, 2 Pa)
 *
 * Model auto-detect: a read of register 59 answers with the gauge type in
 * read_value (0..4 = CDG025D, CDG045D, CDG100D, CDG160D, CDG200D).
 */

#include "gaugelink/protocol_codec.hpp"

namespace gaugelink::codecs {

struct CapacitanceStatus {
    bool heating{false};
    bool temperature_ok{false};
    bool emission{false};
    const char* unit{"mbar"};
};

class CapacitanceCodec : public ProtocolCodec {
public:
    explicit CapacitanceCodec(DeviceModel model);

    CodecKind kind() const override { return CodecKind::Capacitance; }
    bool encode(const DeviceCommand& cmd, EncodedFrame& out, std::string& err) const override;
    DeviceResponse decode(const Bytes& raw, const ResponseHint& hint) const override;
    std::vector<EncodedFrame> probe_frames() const override;
    ReadSpec read_spec() const override;

    static constexpr uint8_t kRequestLead = 0x03;
    static constexpr uint8_t kSync = 0x07;
    static constexpr std::size_t kReplySize = 9;
    static constexpr uint8_t kTypeRegister = 59;

    /// Structural check only: size, sync byte and checksum. Empty on success.
    static std::string validate(const Bytes& raw);

    static double pressure_from(uint8_t hi, uint8_t lo);
    static CapacitanceStatus status_from(uint8_t status);

    /**
     * @brief Map a reply to the gauge-type read onto a concrete model.
     * @return false for malformed frames or unknown type codes.
     */
    static bool detect_model(const Bytes& raw, DeviceModel& out);

    /// Raw request frame for @p service / @p address / @p data.
    static Bytes request(uint8_t service, uint8_t address, uint8_t data);
};

} // namespace gaugelink::codecs

#pragma once
/**
 * @file pfeiffer_binary_codec.hpp
 * @brief CRC16-framed binary protocol of the Pfeiffer/INFICON gauge family.
 *
 * @details
 * Request layout (all multi-byte fields big-endian except the CRC):
 *
 *   [addr, device_id, 0x00, length, cmd, pid_hi, pid_lo, 0x00, 0x00, params..., crc_lo, crc_hi]
 *
 * - addr     : 0x00 point-to-point, the multidrop address on RS485
 * - cmd      : 0x01 read, 0x03 write
 * - length   : 5 + number of parameter bytes, so total frame = length + 6
 * - crc      : crc16_ccitt over every byte before it, little-endian
 *
 * Replies use the same shape; the payload starts at byte 9. Known pids are
 * decoded to readable text (pressure, temperature, status words, run hours,
 * text fields); unknown pids come back as a hex dump with success=true
 * because firmware revisions add readable fields all the time.
 */

#include "gaugelink/protocol_codec.hpp"

namespace gaugelink::codecs {

class PfeifferBinaryCodec : public ProtocolCodec {
public:
    PfeifferBinaryCodec(DeviceModel model, bool rs485, int address);

    CodecKind kind() const override { return CodecKind::PfeifferBinary; }
    bool encode(const DeviceCommand& cmd, EncodedFrame& out, std::string& err) const override;
    DeviceResponse decode(const Bytes& raw, const ResponseHint& hint) const override;
    std::vector<EncodedFrame> probe_frames() const override;
    ReadSpec read_spec() const override;

    uint8_t device_id() const { return device_id_; }
    uint8_t wire_address() const { return rs485() ? static_cast<uint8_t>(address()) : 0x00; }

    static constexpr std::size_t kHeaderSize = 9;
    static constexpr std::size_t kMinFrame = kHeaderSize + 2;

private:
    DeviceResponse decode_payload(uint16_t pid, const Bytes& raw, const uint8_t* data, std::size_t len,
                                  const ResponseHint& hint) const;
    const CommandDefinition* find_pid(uint16_t pid) const;

    uint8_t device_id_;
    ErrorBitLayout layout_;
};

} // namespace gaugelink::codecs

#pragma once
/**
 * @file turbo_ascii_codec.hpp
 * @brief Fixed-width ASCII telegrams of the TC600 turbo-pump controller.
 *
 * @details
 * Telegram: {addr:03d}{action:02d}{pid:03d}{len:02d}{data}{checksum:03d}\r
 *
 * - action   : 00 read (data "=?", len 02), 10 write
 * - data     : boolean_old "111111"/"000000", u_integer 6-digit decimal,
 *              u_real value*100 as 6-digit decimal, string 6 chars
 * - checksum : sum of every preceding ASCII byte mod 256, 3 decimal digits
 *
 * Replies have the same shape. The controller reports rejected telegrams by
 * putting NO_DEF, _RANGE or _LOGIC in the data field; those are surfaced as
 * device errors and never parsed as values.
 */

#include "gaugelink/protocol_codec.hpp"

namespace gaugelink::codecs {

class TurboAsciiCodec : public ProtocolCodec {
public:
    TurboAsciiCodec(DeviceModel model, bool rs485, int address);

    CodecKind kind() const override { return CodecKind::TurboAscii; }
    bool encode(const DeviceCommand& cmd, EncodedFrame& out, std::string& err) const override;
    DeviceResponse decode(const Bytes& raw, const ResponseHint& hint) const override;
    std::vector<EncodedFrame> probe_frames() const override;
    ReadSpec read_spec() const override;

    /// Append the 3-digit checksum and the CR terminator to @p body.
    static std::string seal(const std::string& body);

    static constexpr std::size_t kHeaderSize = 10;
    static constexpr const char* kTerminator = "\r";
};

} // namespace gaugelink::codecs

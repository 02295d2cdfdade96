#pragma once
/**
 * @file ascii_mnemonic_codec.hpp
 * @brief MKS-style ASCII protocol of the PPG550/PPG570 gauges.
 *
 * @details
 * Request : @{address:03d}{mnemonic}{?|!}[value]\
 * Reply   : @ACK{payload}\   or   @NAK{reason}\
 *
 * The address is 254 (broadcast) on RS232 and the configured multidrop
 * address on RS485. Replies may also carry the address after the '@'
 * ("@254ACK..."); both shapes are accepted.
 *
 * Frames end with a single backslash. Older firmware appends ";FF" before
 * the backslash; the decoder strips it so both generations parse, but
 * requests are always sent in the backslash-only form.
 */

#include "gaugelink/protocol_codec.hpp"

namespace gaugelink::codecs {

class AsciiMnemonicCodec : public ProtocolCodec {
public:
    AsciiMnemonicCodec(DeviceModel model, bool rs485, int address);

    CodecKind kind() const override { return CodecKind::AsciiMnemonic; }
    bool encode(const DeviceCommand& cmd, EncodedFrame& out, std::string& err) const override;
    DeviceResponse decode(const Bytes& raw, const ResponseHint& hint) const override;
    std::vector<EncodedFrame> probe_frames() const override;
    ReadSpec read_spec() const override;

    /// "254" on RS232, the zero-padded multidrop address on RS485.
    std::string wire_address() const;

    static constexpr const char* kTerminator = "\\";
    static constexpr const char* kNakMarker = "@NAK";
    static constexpr int kBroadcastAddress = 254;
};

} // namespace gaugelink::codecs

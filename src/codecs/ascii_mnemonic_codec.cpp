// ============================================================================
// ascii_mnemonic_codec.cpp - implementation for ascii_mnemonic_codec.hpp
// ============================================================================

#include "gaugelink/codecs/ascii_mnemonic_codec.hpp"
#include "gaugelink/codecs/codec_text.hpp"

#include <cctype>

namespace gaugelink::codecs {

namespace {

// Request value as the gauge expects it: reals in scientific notation,
// everything else verbatim.
bool value_text(const ParamValue& v, std::string& out, std::string& err) {
    if (auto d = std::get_if<double>(&v)) {
        out = sci(*d);
        return true;
    }
    out = value_to_string(v);
    for (char c : out) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (u > 0x7F || u < 0x20) { err = "encode_error:non_ascii"; return false; }
        if (c == '\\') { err = "encode_error:terminator_in_value"; return false; }
    }
    return true;
}

// Payload with the frame tail ("\", legacy ";FF") and whitespace removed.
std::string strip_tail(std::string s) {
    s = trimmed_text(s);
    if (!s.empty() && s.back() == '\\') s.pop_back();
    if (s.size() >= 3 && s.compare(s.size() - 3, 3, ";FF") == 0) s.resize(s.size() - 3);
    return trimmed_text(s);
}

std::vector<std::string> split_values(const std::string& payload) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        std::size_t comma = payload.find(',', start);
        std::string item = trimmed_text(payload.substr(start, comma == std::string::npos ? std::string::npos
                                                                                          : comma - start));
        if (!item.empty()) out.push_back(item);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

} // namespace

AsciiMnemonicCodec::AsciiMnemonicCodec(DeviceModel model, bool rs485, int address)
: ProtocolCodec(model, rs485, address) {}

std::string AsciiMnemonicCodec::wire_address() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%03d", rs485() ? address() : kBroadcastAddress);
    return buf;
}

bool AsciiMnemonicCodec::encode(const DeviceCommand& cmd, EncodedFrame& out, std::string& err) const {
    const CommandDefinition* def = resolve(cmd, err);
    if (!def) return false;

    const bool write = (cmd.kind == CommandKind::Set);
    std::string s = "@" + wire_address() + def->mnemonic + (write ? "!" : "?");

    if (write && def->param_type.kind != ParamType::Kind::None) {
        std::string v;
        if (!value_text(*cmd.value(), v, err)) return false;
        s += v;
    }
    s += kTerminator;

    out.bytes.assign(s.begin(), s.end());
    out.hint = hint_for(cmd, *def);
    return true;
}

// ---------------------------------------------------------------------------
// decode()
// --------
//   "@ACK7.50E+2\"          -> success, payload "7.50E+2"
//   "@254ACK1.0E-3,2.0E-3\" -> success, values {"1.0E-3", "2.0E-3"}
//   "@NAK160\"              -> failure, message "160"
// ---------------------------------------------------------------------------
DeviceResponse AsciiMnemonicCodec::decode(const Bytes& raw, const ResponseHint& hint) const {
    (void)hint;
    if (raw.empty()) return DeviceResponse::fail(ErrorKind::Timeout, "no response received", raw);

    for (uint8_t b : raw) {
        if (b > 0x7F) return DeviceResponse::fail(ErrorKind::Framing, "invalid response format", raw);
    }

    const std::string text = trimmed_text(raw.data(), raw.size());
    std::size_t pos = 0;
    if (text.empty() || text[0] != '@')
        return DeviceResponse::fail(ErrorKind::Framing, "invalid response format", raw);
    pos = 1;
    while (pos < text.size() && pos < 4 && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;

    if (text.compare(pos, 3, "NAK") == 0) {
        std::string reason = strip_tail(text.substr(pos + 3));
        if (reason.empty()) reason = "unknown error";
        auto r = DeviceResponse::fail(ErrorKind::Device, reason, raw);
        r.formatted = reason;
        return r;
    }

    if (text.compare(pos, 3, "ACK") == 0) {
        const std::string payload = strip_tail(text.substr(pos + 3));
        auto values = split_values(payload);
        std::string joined;
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i) joined += ", ";
            joined += values[i];
        }
        auto r = DeviceResponse::ok(raw, joined);
        r.values = std::move(values);
        return r;
    }

    return DeviceResponse::fail(ErrorKind::Framing, "invalid response format", raw);
}

std::vector<EncodedFrame> AsciiMnemonicCodec::probe_frames() const {
    if (model() == DeviceModel::PPG570)
        return encode_probes(*this, {"software_version", "pressure", "atm_pressure"});
    return encode_probes(*this, {"software_version", "pressure"});
}

ReadSpec AsciiMnemonicCodec::read_spec() const {
    ReadSpec s;
    s.strategy = ReadStrategy::Terminator;
    s.terminator = kTerminator;
    s.nak_marker = kNakMarker;
    s.nak_terminator = kTerminator;
    s.marker_address_digits = 3;
    return s;
}

} // namespace gaugelink::codecs

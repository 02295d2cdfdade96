// ============================================================================
// turbo_ascii_codec.cpp - implementation for turbo_ascii_codec.hpp
// ============================================================================

#include "gaugelink/codecs/turbo_ascii_codec.hpp"
#include "gaugelink/codecs/codec_text.hpp"
#include "gaugelink/checksum.hpp"

#include <cctype>
#include <cstdlib>

namespace gaugelink::codecs {

namespace {

struct DeviceRejection {
    const char* marker;
    const char* message;
};

const DeviceRejection kRejections[] = {
    {"NO_DEF", "parameter does not exist"},
    {"_RANGE", "value out of range"},
    {"_LOGIC", "command logic error"},
};

bool digits(const std::string& s, std::size_t pos, std::size_t n) {
    if (pos + n > s.size()) return false;
    for (std::size_t i = pos; i < pos + n; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

std::string padded(int v, int width) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%0*d", width, v);
    return buf;
}

std::string value_text(const ParamValue& v, const ParamType& t, const std::string& unit) {
    switch (t.kind) {
        case ParamType::Kind::AsciiBooleanOld:
            return std::get<bool>(v) ? "On" : "Off";
        case ParamType::Kind::AsciiUReal:
            return with_unit(fixed(std::get<double>(v), 2), unit);
        case ParamType::Kind::AsciiUInteger:
            return with_unit(std::to_string(std::get<long long>(v)), unit);
        default:
            return with_unit(value_to_string(v), unit);
    }
}

} // namespace

TurboAsciiCodec::TurboAsciiCodec(DeviceModel model, bool rs485, int address)
: ProtocolCodec(model, rs485, address) {}

std::string TurboAsciiCodec::seal(const std::string& body) {
    return body + padded(additive_checksum(body), 3) + kTerminator;
}

bool TurboAsciiCodec::encode(const DeviceCommand& cmd, EncodedFrame& out, std::string& err) const {
    const CommandDefinition* def = resolve(cmd, err);
    if (!def) return false;

    std::string body = padded(address(), 3);
    if (cmd.kind == CommandKind::Set) {
        Bytes data;
        if (def->param_type.kind != ParamType::Kind::None &&
            !encode_param(def->param_type, *cmd.value(), data, err)) {
            return false;
        }
        body += "10" + padded(def->pid, 3) + padded(static_cast<int>(data.size()), 2);
        body.append(data.begin(), data.end());
    } else {
        body += "00" + padded(def->pid, 3) + "02=?";
    }

    const std::string telegram = seal(body);
    out.bytes.assign(telegram.begin(), telegram.end());
    out.hint = hint_for(cmd, *def);
    return true;
}

// ---------------------------------------------------------------------------
// decode()
// --------
// Checks, in order: minimum size, device rejection markers, checksum, length
// field. The data field is then decoded with the type of the command that
// asked for it (or, without a hint, the catalog entry of the echoed pid).
// ---------------------------------------------------------------------------
DeviceResponse TurboAsciiCodec::decode(const Bytes& raw, const ResponseHint& hint) const {
    if (raw.empty()) return DeviceResponse::fail(ErrorKind::Timeout, "no response received", raw);

    const std::string text = trimmed_text(raw.data(), raw.size());
    if (text.size() < kHeaderSize)
        return DeviceResponse::fail(ErrorKind::Framing, "response too short", raw);

    for (const auto& rej : kRejections) {
        if (text.find(rej.marker) != std::string::npos)
            return DeviceResponse::fail(ErrorKind::Device, rej.message, raw);
    }

    if (text.size() < kHeaderSize + 3 || !digits(text, text.size() - 3, 3))
        return DeviceResponse::fail(ErrorKind::Framing, "response too short", raw);

    const std::size_t body_len = text.size() - 3;
    const long sum = std::strtol(text.c_str() + body_len, nullptr, 10);
    if (sum != additive_checksum(text.substr(0, body_len)))
        return DeviceResponse::fail(ErrorKind::Framing, "checksum mismatch", raw);

    if (!digits(text, 0, 8) || !digits(text, 8, 2))
        return DeviceResponse::fail(ErrorKind::Framing, "invalid header", raw);

    const std::size_t len = static_cast<std::size_t>(std::atoi(text.substr(8, 2).c_str()));
    if (kHeaderSize + len != body_len)
        return DeviceResponse::fail(ErrorKind::Framing, "invalid length field", raw);

    const int pid = std::atoi(text.substr(5, 3).c_str());
    const CommandDefinition* def = hint.def;
    if (def && def->pid != pid) {
        return DeviceResponse::fail(ErrorKind::Framing,
                                    "unexpected parameter " + padded(pid, 3) + " (expected " +
                                    padded(def->pid, 3) + ")", raw);
    }
    if (!def) {
        for (const auto& d : catalog().commands()) {
            if (d.pid == pid) { def = &d; break; }
        }
    }

    const std::string data = text.substr(kHeaderSize, len);
    if (trimmed_text(data).empty()) return DeviceResponse::ok(raw, "No data");

    if (!def) {
        auto r = DeviceResponse::ok(raw, data);
        r.values.push_back(data);
        return r;
    }

    ParamValue v;
    std::string err;
    if (!decode_param(def->param_type, reinterpret_cast<const uint8_t*>(data.data()), data.size(), v, err))
        return DeviceResponse::fail(ErrorKind::Framing, err, raw);

    auto r = DeviceResponse::ok(raw, value_text(v, def->param_type, def->unit));
    r.values.push_back(value_to_string(v));
    return r;
}

std::vector<EncodedFrame> TurboAsciiCodec::probe_frames() const {
    return encode_probes(*this, {"get_speed", "get_error"});
}

ReadSpec TurboAsciiCodec::read_spec() const {
    ReadSpec s;
    s.strategy = ReadStrategy::Terminator;
    s.terminator = kTerminator;
    return s;
}

} // namespace gaugelink::codecs

// ============================================================================
// capacitance_codec.cpp - implementation for capacitance_codec.hpp
// ============================================================================

#include "gaugelink/codecs/capacitance_codec.hpp"
#include "gaugelink/codecs/codec_text.hpp"
#include "gaugelink/checksum.hpp"
#include "gaugelink/output_format.hpp"

namespace gaugelink::codecs {

namespace {

const DeviceModel kTypeCodes[] = {
    DeviceModel::CDG025D, DeviceModel::CDG045D, DeviceModel::CDG100D,
    DeviceModel::CDG160D, DeviceModel::CDG200D
};

std::string status_text(const CapacitanceStatus& s) {
    std::string t;
    auto add = [&t](const char* flag) {
        if (!t.empty()) t += ",";
        t += flag;
    };
    if (s.heating)        add("heating");
    if (s.temperature_ok) add("temp_ok");
    if (s.emission)       add("emission");
    return t.empty() ? "idle" : t;
}

} // namespace

CapacitanceCodec::CapacitanceCodec(DeviceModel model)
: ProtocolCodec(model, false, 0) {}

Bytes CapacitanceCodec::request(uint8_t service, uint8_t address, uint8_t data) {
    Bytes msg{kRequestLead, service, address, data};
    msg.push_back(additive_checksum(msg.data() + 1, 3));
    return msg;
}

bool CapacitanceCodec::encode(const DeviceCommand& cmd, EncodedFrame& out, std::string& err) const {
    const CommandDefinition* def = resolve(cmd, err);
    if (!def) return false;

    uint8_t service = static_cast<uint8_t>(ServiceCode::Read);
    if (def->service == ServiceCode::Special)  service = static_cast<uint8_t>(ServiceCode::Special);
    else if (cmd.kind == CommandKind::Set)     service = static_cast<uint8_t>(ServiceCode::Write);

    uint8_t data = 0x00;
    if (cmd.kind == CommandKind::Set && def->param_type.kind != ParamType::Kind::None) {
        Bytes b;
        if (!encode_param(def->param_type, *cmd.value(), b, err)) return false;
        if (b.size() != 1) {
            err = "encode_error:value_wider_than_data_byte";
            return false;
        }
        data = b[0];
    }

    out.bytes = request(service, static_cast<uint8_t>(def->pid & 0xFF), data);
    out.hint = hint_for(cmd, *def);
    return true;
}

std::string CapacitanceCodec::validate(const Bytes& raw) {
    if (raw.size() != kReplySize) return "invalid response length";
    if (raw[0] != kSync) return "invalid start byte";
    if (additive_checksum(raw.data() + 1, 7) != raw[8]) return "checksum mismatch";
    return {};
}

double CapacitanceCodec::pressure_from(uint8_t hi, uint8_t lo) {
    const int16_t v = static_cast<int16_t>(static_cast<uint16_t>((hi << 8) | lo));
    return static_cast<double>(v) / 16384.0;
}

CapacitanceStatus CapacitanceCodec::status_from(uint8_t status) {
    static const char* const kUnits[] = {"mbar", "Torr", "Pa", "unknown"};
    CapacitanceStatus s;
    s.heating = (status & 0x80) != 0;
    s.temperature_ok = (status & 0x40) != 0;
    s.emission = (status & 0x20) != 0;
    s.unit = kUnits[(status >> 4) & 0x03];
    return s;
}

bool CapacitanceCodec::detect_model(const Bytes& raw, DeviceModel& out) {
    if (!validate(raw).empty()) return false;
    const uint8_t code = raw[6];
    if (code >= sizeof(kTypeCodes) / sizeof(kTypeCodes[0])) return false;
    out = kTypeCodes[code];
    return true;
}

DeviceResponse CapacitanceCodec::decode(const Bytes& raw, const ResponseHint& hint) const {
    if (raw.empty()) return DeviceResponse::fail(ErrorKind::Timeout, "no response received", raw);

    const std::string bad = validate(raw);
    if (!bad.empty()) return DeviceResponse::fail(ErrorKind::Framing, bad, raw);

    if (hint.command == "pressure") {
        const double p = pressure_from(raw[4], raw[5]);
        const CapacitanceStatus st = status_from(raw[2]);
        const std::string value = sci(p);
        auto r = DeviceResponse::ok(raw, "Pressure: " + value + " " + st.unit + ", status: " + status_text(st));
        r.values = {value, st.unit};
        return r;
    }
    if (hint.command == "temperature") {
        const bool ok = status_from(raw[2]).temperature_ok;
        auto r = DeviceResponse::ok(raw, ok ? "Temperature OK" : "Temperature not ready");
        r.values.push_back(ok ? "ok" : "not_ready");
        return r;
    }
    if (hint.command == "cdg_type") {
        DeviceModel m{};
        std::string name = detect_model(raw, m) ? model_name(m) : "unknown(" + std::to_string(raw[6]) + ")";
        auto r = DeviceResponse::ok(raw, "CDG type: " + name);
        r.values.push_back(name);
        return r;
    }
    return DeviceResponse::ok(raw, "Response: " + hex_upper(raw));
}

std::vector<EncodedFrame> CapacitanceCodec::probe_frames() const {
    std::vector<EncodedFrame> out = encode_probes(*this, {"cdg_type"});

    EncodedFrame page0;
    page0.bytes = request(static_cast<uint8_t>(ServiceCode::Read), 0x00, 0x00);
    page0.hint.command = "page0";
    out.push_back(std::move(page0));
    return out;
}

ReadSpec CapacitanceCodec::read_spec() const {
    ReadSpec s;
    s.strategy = ReadStrategy::FixedFrame;
    s.sync_byte = kSync;
    s.frame_length = kReplySize;
    return s;
}

} // namespace gaugelink::codecs

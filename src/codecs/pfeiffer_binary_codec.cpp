// ============================================================================
// pfeiffer_binary_codec.cpp - implementation for pfeiffer_binary_codec.hpp
// ============================================================================

#include "gaugelink/codecs/pfeiffer_binary_codec.hpp"
#include "gaugelink/codecs/codec_text.hpp"
#include "gaugelink/checksum.hpp"
#include "gaugelink/output_format.hpp"

namespace gaugelink::codecs {

namespace {

enum : uint16_t {
    kPidRunHours      = 104,
    kPidSerialNumber  = 207,
    kPidProductName   = 208,
    kPidSoftware      = 218,
    kPidPressure      = 221,
    kPidTemperature   = 222,
    kPidActiveSensor  = 223,
    kPidErrorStatus   = 228,
    kPidCcigStatus    = 533
};

uint32_t be_value(const uint8_t* p, std::size_t len) {
    uint32_t v = 0;
    for (std::size_t i = 0; i < len && i < 4; ++i) v = (v << 8) | p[i];
    return v;
}

struct FlagBit {
    uint32_t mask;
    const char* name;
};

const FlagBit kStandardErrors[] = {
    {0x01, "sensor_error"},
    {0x02, "electronics_error"},
    {0x04, "calibration_error"},
    {0x08, "memory_error"},
};

const FlagBit kMagMpgErrors[] = {
    {0x001, "eeprom_timeout"},
    {0x002, "eeprom_crc"},
    {0x004, "eeprom_error"},
    {0x008, "pirani_filament"},
    {0x800, "ccig_short"},
};

const FlagBit kActiveSensor[] = {
    {0x01, "ccig"},
    {0x02, "pirani"},
    {0x04, "mixed"},
};

template <std::size_t N>
std::vector<std::string> set_flags(uint32_t v, const FlagBit (&table)[N]) {
    std::vector<std::string> out;
    for (const auto& f : table) {
        if (v & f.mask) out.emplace_back(f.name);
    }
    return out;
}

std::string join(const std::vector<std::string>& v, const char* sep) {
    std::string s;
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i) s += sep;
        s += v[i];
    }
    return s;
}

const char* ccig_state(uint8_t s) {
    switch (s) {
        case 0: return "off";
        case 1: return "on_not_ignited";
        case 3: return "on_ignited";
        default: return nullptr;
    }
}

} // namespace

PfeifferBinaryCodec::PfeifferBinaryCodec(DeviceModel model, bool rs485, int address)
: ProtocolCodec(model, rs485, address),
  device_id_(model_info(model).device_id),
  layout_(model_info(model).error_layout) {}

// ---------------------------------------------------------------------------
// encode()
// --------
// Header first with length=5, then parameter bytes (writes only). The length
// byte is rewritten after the parameters so that total = length + 6 holds for
// every frame we emit.
// ---------------------------------------------------------------------------
bool PfeifferBinaryCodec::encode(const DeviceCommand& cmd, EncodedFrame& out, std::string& err) const {
    const CommandDefinition* def = resolve(cmd, err);
    if (!def) return false;

    const bool write = (cmd.kind == CommandKind::Set);
    Bytes msg{
        wire_address(),
        device_id_,
        0x00,
        0x05,
        static_cast<uint8_t>(write ? 0x03 : 0x01),
        static_cast<uint8_t>((def->pid >> 8) & 0xFF),
        static_cast<uint8_t>(def->pid & 0xFF),
        0x00, 0x00
    };

    if (write && def->param_type.kind != ParamType::Kind::None) {
        Bytes params;
        if (!encode_param(def->param_type, *cmd.value(), params, err)) return false;
        msg.insert(msg.end(), params.begin(), params.end());
        msg[3] = static_cast<uint8_t>(msg.size() - 4);
    }

    const uint16_t crc = crc16_ccitt(msg);
    msg.push_back(static_cast<uint8_t>(crc & 0xFF));
    msg.push_back(static_cast<uint8_t>((crc >> 8) & 0xFF));

    out.bytes = std::move(msg);
    out.hint = hint_for(cmd, *def);
    return true;
}

// ---------------------------------------------------------------------------
// decode()
// --------
// Structural checks in order; the first one that fails names the response.
// ---------------------------------------------------------------------------
DeviceResponse PfeifferBinaryCodec::decode(const Bytes& raw, const ResponseHint& hint) const {
    if (raw.size() < 7)
        return DeviceResponse::fail(ErrorKind::Framing, "invalid length", raw);
    if (raw[1] != device_id_)
        return DeviceResponse::fail(ErrorKind::Framing, "invalid device id", raw);
    if (raw.size() != static_cast<std::size_t>(raw[3]) + 6)
        return DeviceResponse::fail(ErrorKind::Framing, "invalid length", raw);

    const std::size_t n = raw.size();
    const uint16_t received = static_cast<uint16_t>(raw[n - 2] | (raw[n - 1] << 8));
    if (received != crc16_ccitt(raw.data(), n - 2))
        return DeviceResponse::fail(ErrorKind::Framing, "crc mismatch", raw);

    if (n < kMinFrame)
        return DeviceResponse::fail(ErrorKind::Framing, "invalid length", raw);

    if (raw[2] != 0x00) {
        return DeviceResponse::fail(ErrorKind::Device,
                                    "device rejected request (code " + hex_upper(&raw[2], 1) + ")", raw);
    }

    const uint16_t pid = static_cast<uint16_t>((raw[5] << 8) | raw[6]);
    return decode_payload(pid, raw, raw.data() + kHeaderSize, n - kMinFrame, hint);
}

const CommandDefinition* PfeifferBinaryCodec::find_pid(uint16_t pid) const {
    for (const auto& d : catalog().commands()) {
        if (d.pid == pid && d.readable) return &d;
    }
    for (const auto& d : catalog().commands()) {
        if (d.pid == pid) return &d;
    }
    return nullptr;
}

DeviceResponse PfeifferBinaryCodec::decode_payload(uint16_t pid, const Bytes& raw, const uint8_t* data,
                                                   std::size_t len, const ResponseHint& hint) const {
    const CommandDefinition* def = find_pid(pid);

    // Acknowledgement of a write or an action: nothing to interpret.
    if (len == 0) {
        std::string name = def ? def->name : (hint.command.empty() ? std::to_string(pid) : hint.command);
        return DeviceResponse::ok(raw, name + ": ok");
    }

    switch (pid) {
        case kPidPressure: {
            ParamValue v;
            std::string err;
            const ParamType t = def ? def->param_type : ParamType::log_fixed_en26();
            if (!decode_param(t, data, len, v, err)) return DeviceResponse::fail(ErrorKind::Framing, err, raw);
            const std::string text = sci(std::get<double>(v));
            auto r = DeviceResponse::ok(raw, "Pressure: " + text + " mbar");
            r.values.push_back(text);
            return r;
        }
        case kPidTemperature: {
            ParamValue v;
            std::string err;
            if (!decode_param(ParamType::float32(), data, len, v, err))
                return DeviceResponse::fail(ErrorKind::Framing, err, raw);
            const std::string text = fixed(std::get<double>(v), 1);
            auto r = DeviceResponse::ok(raw, "Temperature: " + text + " C");
            r.values.push_back(text);
            return r;
        }
        case kPidErrorStatus: {
            const uint32_t flags = be_value(data, len);
            auto names = (layout_ == ErrorBitLayout::MagMpg) ? set_flags(flags, kMagMpgErrors)
                                                             : set_flags(flags, kStandardErrors);
            auto r = DeviceResponse::ok(raw, "Errors: " + (names.empty() ? std::string("none") : join(names, ", ")));
            r.values = std::move(names);
            return r;
        }
        case kPidActiveSensor: {
            auto names = set_flags(data[0], kActiveSensor);
            auto r = DeviceResponse::ok(raw, "Active sensor: " + (names.empty() ? std::string("none") : join(names, ", ")));
            r.values = std::move(names);
            return r;
        }
        case kPidCcigStatus: {
            const char* s = ccig_state(data[0]);
            std::string state = s ? s : "unknown(" + std::to_string(data[0]) + ")";
            auto r = DeviceResponse::ok(raw, (def ? def->name : std::string("ccig_status")) + ": " + state);
            r.values.push_back(state);
            return r;
        }
        case kPidRunHours: {
            const std::string text = fixed(be_value(data, len) * 0.25, 2);
            auto r = DeviceResponse::ok(raw, "Run hours: " + text + " h");
            r.values.push_back(text);
            return r;
        }
        case kPidSerialNumber:
        case kPidProductName:
        case kPidSoftware: {
            std::string text = trimmed_text(data, len);
            auto r = DeviceResponse::ok(raw, (def ? def->name : std::to_string(pid)) + ": " + text);
            r.values.push_back(text);
            return r;
        }
        default:
            break;
    }

    if (def && def->param_type.kind != ParamType::Kind::None) {
        ParamValue v;
        std::string err;
        if (!decode_param(def->param_type, data, len, v, err))
            return DeviceResponse::fail(ErrorKind::Framing, err, raw);
        std::string text;
        if (auto d = std::get_if<double>(&v)) text = sci(*d);
        else text = value_to_string(v);
        auto r = DeviceResponse::ok(raw, def->name + ": " + with_unit(text, def->unit));
        r.values.push_back(text);
        return r;
    }

    const std::string dump = hex_upper(data, len);
    auto r = DeviceResponse::ok(raw, "pid " + std::to_string(pid) + ": " + dump);
    r.values.push_back(dump);
    return r;
}

std::vector<EncodedFrame> PfeifferBinaryCodec::probe_frames() const {
    return encode_probes(*this, {"pressure", "software_version"});
}

ReadSpec PfeifferBinaryCodec::read_spec() const {
    ReadSpec s;
    s.strategy = ReadStrategy::Idle;
    return s;
}

} // namespace gaugelink::codecs

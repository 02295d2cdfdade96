// ============================================================================
// protocol_codec.cpp - shared codec checks and the make_codec() factory
// ============================================================================

#include "gaugelink/protocol_codec.hpp"
#include "gaugelink/codecs/ascii_mnemonic_codec.hpp"
#include "gaugelink/codecs/capacitance_codec.hpp"
#include "gaugelink/codecs/pfeiffer_binary_codec.hpp"
#include "gaugelink/codecs/turbo_ascii_codec.hpp"

namespace gaugelink {

// ---------------------------------------------------------------------------
// resolve()
// ---------
// The checks below apply to every family:
//   - Query needs a readable command, Set a writable one.
//   - A Set of a typed command needs a "value".
//   - A declared range must hold.
// Type-specific checks (width, sign, ASCII) happen in encode_param().
// ---------------------------------------------------------------------------
const CommandDefinition* ProtocolCodec::resolve(const DeviceCommand& cmd, std::string& err) const {
    const CommandDefinition& def = catalog_.at(cmd.name);

    if (cmd.kind == CommandKind::Query && !def.readable) {
        err = "encode_error:write_only(" + def.name + ")";
        return nullptr;
    }
    if (cmd.kind == CommandKind::Set) {
        if (!def.writable) {
            err = "encode_error:read_only(" + def.name + ")";
            return nullptr;
        }
        if (def.param_type.kind != ParamType::Kind::None) {
            const ParamValue* v = cmd.value();
            if (!v) {
                err = "encode_error:missing_value(" + def.name + ")";
                return nullptr;
            }
            if (!check_range(def, *v, err)) return nullptr;
        }
    }
    return &def;
}

bool ProtocolCodec::check_range(const CommandDefinition& def, const ParamValue& v, std::string& err) {
    if (!def.min_value && !def.max_value) return true;
    double d = 0.0;
    if (!value_to_double(v, d)) {
        err = "encode_error:not_a_number";
        return false;
    }
    if (!def.in_range(d)) {
        err = "encode_error:out_of_range" + def.range_text();
        return false;
    }
    return true;
}

std::vector<EncodedFrame> encode_probes(const ProtocolCodec& codec, const std::vector<std::string>& names) {
    std::vector<EncodedFrame> out;
    for (const auto& n : names) {
        EncodedFrame f;
        std::string err;
        if (codec.encode(DeviceCommand::query(n), f, err)) out.push_back(std::move(f));
    }
    return out;
}

std::unique_ptr<ProtocolCodec> make_codec(DeviceModel model, bool rs485, int address) {
    switch (model_info(model).codec) {
        case CodecKind::PfeifferBinary:
            return std::make_unique<codecs::PfeifferBinaryCodec>(model, rs485, address);
        case CodecKind::Capacitance:
            return std::make_unique<codecs::CapacitanceCodec>(model);
        case CodecKind::AsciiMnemonic:
            return std::make_unique<codecs::AsciiMnemonicCodec>(model, rs485, address);
        case CodecKind::TurboAscii:
            break;
    }
    return std::make_unique<codecs::TurboAsciiCodec>(model, rs485, address);
}

} // namespace gaugelink

// ============================================================================
// simulated_transport.cpp - implementation for simulated_transport.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "gaugelink/simulated_transport.hpp"
#include "gaugelink/checksum.hpp"
#include "gaugelink/codecs/capacitance_codec.hpp"
#include "gaugelink/codecs/codec_text.hpp"
#include "gaugelink/log.hpp"

#include <cmath>
#include <cstdlib>
#include <thread>

namespace gaugelink {

namespace {

DeviceResponse not_connected() {
    return DeviceResponse::fail(ErrorKind::Connection, "not connected");
}

DeviceResponse busy_polling() {
    return DeviceResponse::fail(ErrorKind::CallerError, "continuous polling active; stop it first");
}

DeviceResponse text_reply(const std::string& text, std::string value) {
    auto r = DeviceResponse::ok(Bytes(text.begin(), text.end()), text);
    r.values.push_back(std::move(value));
    return r;
}

bool is_text(const ParamType& t) {
    return t.kind == ParamType::Kind::AsciiFixedWidth;
}

} // namespace

SimulatedTransport::SimulatedTransport(LinkConfig cfg)
: cfg_(std::move(cfg)),
  opts_(cfg_.simulator),
  format_(cfg_.output_format()),
  codec_(make_codec(cfg_.model, false, cfg_.effective_address())),
  rng_(opts_.seed) {
    // Capacitance gauges report a fraction of full scale, not mbar.
    if (model_info(cfg_.model).codec == CodecKind::Capacitance) state_.pressure = 0.75;
}

SimulatedTransport::~SimulatedTransport() {
    disconnect();
}

bool SimulatedTransport::connect(std::string& err) {
    (void)err;
    std::lock_guard<std::mutex> lock(io_);
    if (connected_) return true;
    connected_ = true;
    log::info("connected", {{"port", "simulator"}, {"model", model_name(cfg_.model)}});
    if (is_generic_capacitance(cfg_.model)) identify_capacitance();
    return true;
}

void SimulatedTransport::identify_capacitance() {
    const DeviceCommand cmd = DeviceCommand::query("cdg_type");
    EncodedFrame f;
    std::string err;
    if (!codec_->encode(cmd, f, err)) {
        log::warn("auto_detect_failed", {{"reason", err}});
        return;
    }
    DeviceResponse r = capacitance_reply(f, cmd);
    DeviceModel detected{};
    if (!r.success || !codecs::CapacitanceCodec::detect_model(r.raw, detected)) {
        log::warn("auto_detect_failed", {{"reason", r.success ? "unknown type code" : r.error}});
        return;
    }
    cfg_.model = detected;
    codec_ = make_codec(detected, false, cfg_.effective_address());
    log::info("model_detected", {{"model", model_name(detected)}});
}

void SimulatedTransport::disconnect() {
    stop_continuous(kDefaultStopGrace);
    std::lock_guard<std::mutex> lock(io_);
    if (!connected_) return;
    connected_ = false;
    log::info("disconnected", {{"port", "simulator"}});
}

bool SimulatedTransport::is_connected() const {
    std::lock_guard<std::mutex> lock(io_);
    return connected_;
}

double SimulatedTransport::noisy(double v) {
    if (opts_.noise_fraction <= 0.0) return v;
    std::uniform_real_distribution<double> d(-opts_.noise_fraction, opts_.noise_fraction);
    return v * (1.0 + d(rng_));
}

bool SimulatedTransport::roll_error() {
    if (opts_.error_probability <= 0.0) return false;
    std::bernoulli_distribution d(opts_.error_probability > 1.0 ? 1.0 : opts_.error_probability);
    return d(rng_);
}

DeviceResponse SimulatedTransport::finish(DeviceResponse r) const {
    r.display = format_bytes(r.raw, format_);
    return r;
}

DeviceResponse SimulatedTransport::send(const DeviceCommand& cmd) {
    if (poller_.running()) return busy_polling();
    std::lock_guard<std::mutex> lock(io_);
    return send_locked(cmd);
}

// ---------------------------------------------------------------------------
// send_locked()
// -------------
// The real codec encodes first, so unknown names, capability and range
// problems fail exactly as they would on a serial line.
// ---------------------------------------------------------------------------
DeviceResponse SimulatedTransport::send_locked(const DeviceCommand& cmd) {
    if (!connected_) return not_connected();

    EncodedFrame f;
    std::string err;
    if (!codec_->encode(cmd, f, err)) return DeviceResponse::fail(ErrorKind::Encode, err);

    if (opts_.response_delay.count() > 0) std::this_thread::sleep_for(opts_.response_delay);

    if (roll_error()) {
        log::debug("sim_error", {{"command", cmd.name}});
        return DeviceResponse::fail(ErrorKind::Connection, "simulated error: ERR_DISCONNECTED");
    }

    if (codec_->kind() == CodecKind::Capacitance) return finish(capacitance_reply(f, cmd));

    const CommandDefinition& def = *f.hint.def;
    return finish(cmd.kind == CommandKind::Set ? reply_set(cmd, def) : reply_query(def));
}

DeviceResponse SimulatedTransport::reply_query(const CommandDefinition& def) {
    std::string value;
    if (def.name == "pressure" || def.name.find("_pressure") != std::string::npos) {
        value = codecs::sci(noisy(state_.pressure));
    } else if (def.name == "temperature") {
        value = codecs::fixed(noisy(state_.temperature), 1);
    } else if (def.name == "get_speed") {
        value = std::to_string(state_.motor_on ? std::llround(noisy(static_cast<double>(state_.speed))) : 0);
    } else if (def.name == "motor_on") {
        value = state_.motor_on ? "On" : "Off";
    } else {
        auto it = state_.values.find(def.name);
        if (it != state_.values.end()) value = it->second;
        else value = is_text(def.param_type) ? std::string("SIM-") + model_name(cfg_.model) : "0";
    }

    if (def.name == "pressure") return text_reply("Pressure: " + codecs::with_unit(value, def.unit), value);
    if (def.name == "temperature") return text_reply("Temperature: " + value + " C", value);
    return text_reply(codecs::with_unit(value, def.unit), value);
}

DeviceResponse SimulatedTransport::reply_set(const DeviceCommand& cmd, const CommandDefinition& def) {
    const ParamValue* v = cmd.value();
    if (!v) return text_reply(def.name + " executed", "ok");

    if (def.name == "set_speed") {
        double pct = 0.0;
        if (!value_to_double(*v, pct)) return DeviceResponse::fail(ErrorKind::Encode, "encode_error:bad_value");
        const long long rpm = std::llround(kMaxSpeed * pct / 100.0);
        if (rpm < kMinSpeed || rpm > kMaxSpeed) {
            return DeviceResponse::fail(ErrorKind::Device,
                                        "out_of_range(" + std::to_string(kMinSpeed) + ".." +
                                        std::to_string(kMaxSpeed) + " rpm)");
        }
        state_.speed = rpm;
        return text_reply("Speed set to " + std::to_string(rpm) + " rpm", std::to_string(rpm));
    }
    if (def.name == "motor_on") {
        bool on = false;
        if (!value_to_bool(*v, on)) return DeviceResponse::fail(ErrorKind::Encode, "encode_error:bad_value");
        state_.motor_on = on;
        return text_reply(std::string("Motor set to ") + (on ? "On" : "Off"), on ? "On" : "Off");
    }

    const std::string text = value_to_string(*v);
    state_.values[def.name] = text;
    return text_reply(def.name + " set to " + codecs::with_unit(text, def.unit), text);
}

// ---------------------------------------------------------------------------
// capacitance_reply()
// -------------------
// Builds the 9-byte reply a gauge would send and lets the codec decode it.
// The generic CDGxxxD answers the type read as a CDG025D (code 0).
// ---------------------------------------------------------------------------
DeviceResponse SimulatedTransport::capacitance_reply(const EncodedFrame& f, const DeviceCommand& cmd) {
    const ParamValue* v = cmd.value();
    if (cmd.kind == CommandKind::Set && v) state_.values[cmd.name] = value_to_string(*v);

    uint8_t read_value = 0;
    if (cmd.name == "cdg_type") {
        if (!is_generic_capacitance(cfg_.model)) {
            read_value = static_cast<uint8_t>(static_cast<uint8_t>(cfg_.model) -
                                              static_cast<uint8_t>(DeviceModel::CDG025D));
        }
    } else {
        auto it = state_.values.find(cmd.name);
        if (it != state_.values.end()) read_value = static_cast<uint8_t>(std::atoi(it->second.c_str()));
    }

    uint8_t unit = 0;
    auto u = state_.values.find("unit");
    if (u != state_.values.end()) unit = static_cast<uint8_t>(std::atoi(u->second.c_str()) & 0x03);

    double scaled = noisy(state_.pressure) * 16384.0;
    if (scaled > 32767.0) scaled = 32767.0;
    if (scaled < -32768.0) scaled = -32768.0;
    const auto p = static_cast<int16_t>(std::lround(scaled));
    const auto pu = static_cast<uint16_t>(p);

    Bytes frame = {codecs::CapacitanceCodec::kSync,
                   0x00,                                          // page
                   static_cast<uint8_t>(0x40 | (unit << 4)),      // temperature ok
                   0x00,                                          // error
                   static_cast<uint8_t>(pu >> 8),
                   static_cast<uint8_t>(pu & 0xFF),
                   read_value,
                   0x00};
    frame.push_back(additive_checksum(frame.data() + 1, 7));
    return codec_->decode(frame, f.hint);
}

DeviceResponse SimulatedTransport::send_raw(const Bytes& frame) {
    if (poller_.running()) return busy_polling();
    std::lock_guard<std::mutex> lock(io_);
    if (!connected_) return not_connected();
    if (frame.empty()) return DeviceResponse::fail(ErrorKind::Conversion, "conversion_error:empty_frame");
    return finish(DeviceResponse::ok(frame, format_bytes(frame, format_)));
}

DeviceResponse SimulatedTransport::receive() {
    if (poller_.running()) return busy_polling();
    std::lock_guard<std::mutex> lock(io_);
    const CommandDefinition* def = codec_->catalog().continuous_command();
    if (!def) return DeviceResponse::fail(ErrorKind::CallerError, "no_continuous_command");
    return send_locked(DeviceCommand::query(def->name));
}

DeviceResponse SimulatedTransport::probe() {
    if (poller_.running()) return busy_polling();
    std::lock_guard<std::mutex> lock(io_);
    if (!connected_) return not_connected();

    DeviceResponse last = DeviceResponse::fail(ErrorKind::Timeout, "no probe frame answered");
    for (const auto& f : codec_->probe_frames()) {
        if (f.hint.empty()) continue;
        DeviceResponse r = send_locked(DeviceCommand::query(f.hint.command));
        if (r.success) return r;
        last = std::move(r);
    }
    return last;
}

bool SimulatedTransport::start_continuous(std::chrono::milliseconds interval, ResponseSink sink, std::string& err) {
    if (poller_.running()) { err = "caller_error:already_polling"; return false; }

    std::string command;
    {
        std::lock_guard<std::mutex> lock(io_);
        if (!connected_) { err = "not connected"; return false; }
        const CommandDefinition* def = codec_->catalog().continuous_command();
        if (!def) { err = "no_continuous_command"; return false; }
        command = def->name;
    }

    auto step = [this, command]() {
        std::lock_guard<std::mutex> lock(io_);
        return send_locked(DeviceCommand::query(command));
    };
    if (!poller_.start(interval, step, std::move(sink))) {
        err = "caller_error:already_polling";
        return false;
    }
    return true;
}

bool SimulatedTransport::stop_continuous(std::chrono::milliseconds grace) {
    return poller_.stop(grace);
}

void SimulatedTransport::set_output_format(OutputFormat f) {
    std::lock_guard<std::mutex> lock(io_);
    format_ = f;
}

OutputFormat SimulatedTransport::output_format() const {
    std::lock_guard<std::mutex> lock(io_);
    return format_;
}

DeviceModel SimulatedTransport::model() const {
    std::lock_guard<std::mutex> lock(io_);
    return cfg_.model;
}

const CommandCatalog& SimulatedTransport::catalog() const {
    std::lock_guard<std::mutex> lock(io_);
    return codec_->catalog();
}

SimulatedState SimulatedTransport::state() const {
    std::lock_guard<std::mutex> lock(io_);
    return state_;
}

} // namespace gaugelink

// ============================================================================
// transport.cpp - implementation for transport.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "gaugelink/transport.hpp"
#include "gaugelink/codecs/capacitance_codec.hpp"
#include "gaugelink/log.hpp"
#include "gaugelink/transport/transport_linux_serial.hpp"

#include <thread>

namespace gaugelink {

namespace {

void pause(std::chrono::milliseconds d) {
    if (d.count() > 0) std::this_thread::sleep_for(d);
}

DeviceResponse not_connected() {
    return DeviceResponse::fail(ErrorKind::Connection, "not connected");
}

} // namespace

Transport::Transport(LinkConfig cfg)
: Transport(std::move(cfg), std::make_unique<transport::LinuxSerialPort>()) {}

Transport::Transport(LinkConfig cfg, std::unique_ptr<transport::ISerialPort> port)
: cfg_(std::move(cfg)),
  serial_(cfg_.serial_params()),
  rts_(cfg_.rts_timing()),
  mode_(cfg_.rs485 ? ElectricalMode::RS485 : ElectricalMode::RS232),
  format_(cfg_.output_format()),
  port_(std::move(port)) {
    rebuild_codec();
}

Transport::~Transport() {
    disconnect();
}

DeviceResponse Transport::busy_polling() {
    return DeviceResponse::fail(ErrorKind::CallerError, "continuous polling active; stop it first");
}

void Transport::rebuild_codec() {
    codec_ = make_codec(cfg_.model, mode_ == ElectricalMode::RS485, cfg_.effective_address());
}

bool Transport::open_port(std::string& err) {
    transport::PortConfig pc;
    pc.path = cfg_.port;
    pc.serial = serial_;
    if (!port_->open(pc, err)) {
        log::error("open_failed", {{"port", cfg_.port}, {"baud", std::to_string(serial_.baud)}, {"reason", err}});
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// apply_electrical_mode()
// -----------------------
// Adapters without modem lines report failure here; that is logged and
// otherwise ignored because many RS232 gauges do not need them.
// ---------------------------------------------------------------------------
void Transport::apply_electrical_mode() {
    const bool rts = (mode_ == ElectricalMode::RS485) ? rts_.rx_level : true;
    if (!port_->set_dtr(true)) log::debug("dtr_unsupported", {{"port", cfg_.port}});
    if (!port_->set_rts(rts))  log::debug("rts_unsupported", {{"port", cfg_.port}});
}

bool Transport::connect(std::string& err) {
    std::lock_guard<std::mutex> lock(io_);
    if (connected_) return true;

    if (!open_port(err)) return false;
    apply_electrical_mode();
    port_->discard_input();
    connected_ = true;

    log::info("connected", {{"port", cfg_.port},
                            {"model", model_name(cfg_.model)},
                            {"baud", std::to_string(serial_.baud)},
                            {"mode", mode_ == ElectricalMode::RS485 ? "rs485" : "rs232"}});

    if (is_generic_capacitance(cfg_.model)) auto_detect_model();
    return true;
}

// ---------------------------------------------------------------------------
// auto_detect_model()
// -------------------
// Only the generic CDGxxxD placeholder is ever replaced. A concrete model
// stays what the user configured even if the gauge disagrees.
// ---------------------------------------------------------------------------
void Transport::auto_detect_model() {
    if (!is_generic_capacitance(cfg_.model)) return;

    EncodedFrame f;
    std::string err;
    if (!codec_->encode(DeviceCommand::query("cdg_type"), f, err)) {
        log::warn("auto_detect_failed", {{"reason", err}});
        return;
    }
    DeviceResponse r = exchange(f.bytes, f.hint, false);
    DeviceModel detected{};
    if (r.success && codecs::CapacitanceCodec::detect_model(r.raw, detected)) {
        cfg_.model = detected;
        rebuild_codec();
        log::info("model_detected", {{"model", model_name(detected)}});
        return;
    }
    log::warn("auto_detect_failed", {{"reason", r.success ? "unknown type code" : r.error}});
}

void Transport::disconnect() {
    stop_continuous(kDefaultStopGrace);

    std::lock_guard<std::mutex> lock(io_);
    if (!connected_) return;
    if (mode_ == ElectricalMode::RS485) port_->set_rts(rts_.rx_level);
    port_->close();
    connected_ = false;
    log::info("disconnected", {{"port", cfg_.port}});
}

bool Transport::is_connected() const {
    std::lock_guard<std::mutex> lock(io_);
    return connected_;
}

// ---------------------------------------------------------------------------
// send()
// ------
// UnknownCommand from the codec is allowed through: it means the caller
// asked for a command this device does not have.
// ---------------------------------------------------------------------------
DeviceResponse Transport::send(const DeviceCommand& cmd) {
    if (poller_.running()) return busy_polling();
    std::lock_guard<std::mutex> lock(io_);
    return send_locked(cmd);
}

DeviceResponse Transport::send_locked(const DeviceCommand& cmd) {
    if (!connected_) return not_connected();

    EncodedFrame f;
    std::string err;
    if (!codec_->encode(cmd, f, err)) {
        log::debug("encode_failed", {{"command", cmd.name}, {"reason", err}});
        return DeviceResponse::fail(ErrorKind::Encode, err);
    }
    return exchange(f.bytes, f.hint, false);
}

DeviceResponse Transport::send_raw(const Bytes& frame) {
    if (poller_.running()) return busy_polling();
    std::lock_guard<std::mutex> lock(io_);
    if (!connected_) return not_connected();
    if (frame.empty()) return DeviceResponse::fail(ErrorKind::Conversion, "conversion_error:empty_frame");
    return exchange(frame, ResponseHint{}, true);
}

DeviceResponse Transport::receive() {
    if (poller_.running()) return busy_polling();
    std::lock_guard<std::mutex> lock(io_);
    ResponseHint hint;
    if (const CommandDefinition* def = codec_->catalog().continuous_command()) {
        hint = ResponseHint{def->name, def, CommandKind::Query};
    }
    return receive_locked(hint);
}

DeviceResponse Transport::receive_locked(const ResponseHint& hint) {
    if (!connected_) return not_connected();
    return read_reply(hint, false);
}

DeviceResponse Transport::probe() {
    if (poller_.running()) return busy_polling();
    std::lock_guard<std::mutex> lock(io_);
    return probe_locked();
}

DeviceResponse Transport::probe_locked() {
    if (!connected_) return not_connected();

    DeviceResponse last = DeviceResponse::fail(ErrorKind::Timeout, "no probe frame answered");
    for (const auto& f : codec_->probe_frames()) {
        DeviceResponse r = exchange(f.bytes, f.hint, false);
        if (r.success) return r;
        last = std::move(r);
    }
    return last;
}

// ---------------------------------------------------------------------------
// exchange()
// ----------
// One request/reply under the I/O lock. RTS goes back to the receive level
// even when the write fails, so a half-duplex bus is never left driven.
// ---------------------------------------------------------------------------
DeviceResponse Transport::exchange(const Bytes& frame, const ResponseHint& hint, bool raw) {
    port_->discard_input();
    log::debug("tx", {{"port", cfg_.port}, {"command", hint.command}, {"bytes", hex_upper(frame)}});

    const bool rs485 = (mode_ == ElectricalMode::RS485);
    if (rs485) {
        port_->set_rts(rts_.tx_level);
        pause(rts_.before_tx);
    }

    transport::TxResult tx = port_->write(frame.data(), frame.size());

    if (rs485) {
        port_->set_rts(rts_.rx_level);
        pause(rts_.before_rx + rts_.settle);
    }

    if (tx != transport::TxResult::Ok) {
        const char* why = (tx == transport::TxResult::Busy) ? "write timeout" : "write failed";
        log::warn("tx_failed", {{"port", cfg_.port}, {"reason", why}});
        return DeviceResponse::fail(ErrorKind::Connection, why);
    }
    return read_reply(hint, raw);
}

// ---------------------------------------------------------------------------
// read_reply()
// ------------
// Manual frames have no known reply shape, so they are read until the line
// goes quiet. Everything else uses the codec's strategy, and partial frames
// still go to the codec so the failure names the broken check.
// ---------------------------------------------------------------------------
DeviceResponse Transport::read_reply(const ResponseHint& hint, bool raw) {
    FrameReader reader(*port_);
    ReadSpec spec = raw ? ReadSpec{} : codec_->read_spec();
    ReadResult rr = reader.read(spec, serial_.timeout);

    if (!rr.received()) {
        if (rr.status == ReadStatus::Error) {
            log::warn("rx_failed", {{"port", cfg_.port}});
            return DeviceResponse::fail(ErrorKind::Connection, "read failed");
        }
        log::debug("rx_timeout", {{"port", cfg_.port}, {"command", hint.command}});
        return DeviceResponse::fail(ErrorKind::Timeout,
                                    "timeout: no response within " + std::to_string(serial_.timeout.count()) + " ms");
    }

    log::debug("rx", {{"port", cfg_.port},
                      {"status", read_status_name(rr.status)},
                      {"bytes", hex_upper(rr.bytes)}});

    DeviceResponse r = raw ? DeviceResponse::ok(rr.bytes, format_bytes(rr.bytes, format_))
                           : codec_->decode(rr.bytes, hint);
    if (r.raw.empty()) r.raw = rr.bytes;
    r.display = format_bytes(r.raw, format_);
    return r;
}

// ---------------------------------------------------------------------------
// discover_baud()
// ---------------
// Runs entirely under the I/O lock; nobody else may use the port while the
// rate is changing under it.
// ---------------------------------------------------------------------------
bool Transport::discover_baud(std::string& err) {
    if (poller_.running()) { err = "caller_error:polling_active"; return false; }
    std::lock_guard<std::mutex> lock(io_);

    const std::vector<int> candidates = baud_candidates(cfg_.model);
    for (int baud : candidates) {
        port_->close();
        connected_ = false;
        serial_.baud = baud;

        std::string open_err;
        if (!open_port(open_err)) {
            err = open_err;
            continue;
        }
        apply_electrical_mode();
        port_->discard_input();
        connected_ = true;

        log::debug("baud_try", {{"port", cfg_.port}, {"baud", std::to_string(baud)}});
        DeviceResponse r = probe_locked();
        if (r.success) {
            log::info("baud_found", {{"port", cfg_.port}, {"baud", std::to_string(baud)}});
            if (is_generic_capacitance(cfg_.model)) auto_detect_model();
            return true;
        }
    }

    port_->close();
    connected_ = false;
    serial_.baud = candidates.front();
    std::string reopen_err;
    if (open_port(reopen_err)) {
        apply_electrical_mode();
        port_->discard_input();
        connected_ = true;
    }
    err = "no_response_at_any_baud";
    return false;
}

bool Transport::reconfigure(const SerialParams& params, std::string& err) {
    if (poller_.running()) { err = "caller_error:polling_active"; return false; }
    std::lock_guard<std::mutex> lock(io_);

    serial_ = params;
    if (!connected_) return true;

    port_->close();
    connected_ = false;
    if (!open_port(err)) return false;
    apply_electrical_mode();
    port_->discard_input();
    connected_ = true;
    return true;
}

bool Transport::set_electrical_mode(ElectricalMode mode, std::string& err) {
    if (mode == ElectricalMode::RS485 && !model_info(cfg_.model).rs485_capable) {
        err = "bad_value:rs485";
        return false;
    }
    if (poller_.running()) { err = "caller_error:polling_active"; return false; }
    std::lock_guard<std::mutex> lock(io_);

    mode_ = mode;
    cfg_.rs485 = (mode == ElectricalMode::RS485);
    rebuild_codec();
    if (connected_) apply_electrical_mode();
    return true;
}

ElectricalMode Transport::electrical_mode() const {
    std::lock_guard<std::mutex> lock(io_);
    return mode_;
}

// ---------------------------------------------------------------------------
// start_continuous()
// ------------------
// Streaming gauges (CDG045D) push frames on their own; for those the loop
// only reads. Every other model is asked with its continuous command.
// ---------------------------------------------------------------------------
bool Transport::start_continuous(std::chrono::milliseconds interval, ResponseSink sink, std::string& err) {
    if (poller_.running()) { err = "caller_error:already_polling"; return false; }

    ResponseHint hint;
    bool streaming = false;
    {
        std::lock_guard<std::mutex> lock(io_);
        if (!connected_) { err = "not connected"; return false; }
        const CommandDefinition* def = codec_->catalog().continuous_command();
        if (!def) { err = "no_continuous_command"; return false; }
        hint = ResponseHint{def->name, def, CommandKind::Query};
        streaming = model_info(cfg_.model).streams_continuously;
    }

    auto step = [this, hint, streaming]() {
        std::lock_guard<std::mutex> lock(io_);
        return streaming ? receive_locked(hint) : send_locked(DeviceCommand::query(hint.command));
    };

    if (!poller_.start(interval, step, std::move(sink))) {
        err = "caller_error:already_polling";
        return false;
    }
    return true;
}

bool Transport::stop_continuous(std::chrono::milliseconds grace) {
    return poller_.stop(grace);
}

void Transport::set_output_format(OutputFormat f) {
    std::lock_guard<std::mutex> lock(io_);
    format_ = f;
}

OutputFormat Transport::output_format() const {
    std::lock_guard<std::mutex> lock(io_);
    return format_;
}

DeviceModel Transport::model() const {
    std::lock_guard<std::mutex> lock(io_);
    return cfg_.model;
}

const CommandCatalog& Transport::catalog() const {
    std::lock_guard<std::mutex> lock(io_);
    return codec_->catalog();
}

SerialParams Transport::serial_params() const {
    std::lock_guard<std::mutex> lock(io_);
    return serial_;
}

} // namespace gaugelink

// ============================================================================
// config.cpp - implementation for config.hpp
// ============================================================================

#include "gaugelink/config.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace gaugelink {

using json = nlohmann::json;

namespace {

const int kLineRates[] = {1200, 2400, 4800, 9600, 19200, 38400, 57600, 115200};

bool is_line_rate(int baud) {
    for (int r : kLineRates) {
        if (r == baud) return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Typed getters. Each one is a no-op when the key is absent and fails with
// "bad_value:<field>" when it is present with the wrong type.
// ---------------------------------------------------------------------------
template <typename T>
bool get_opt(const json& j, const char* key, const std::string& field, std::optional<T>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    try {
        out = it->template get<T>();
    } catch (const json::exception&) {
        err = "bad_value:" + field;
        return false;
    }
    return true;
}

template <typename T>
bool get_to(const json& j, const char* key, const std::string& field, T& out, std::string& err) {
    std::optional<T> v;
    if (!get_opt(j, key, field, v, err)) return false;
    if (v) out = *v;
    return true;
}

bool get_ms(const json& j, const char* key, const std::string& field,
            std::chrono::milliseconds& out, std::string& err) {
    std::optional<long long> v;
    if (!get_opt(j, key, field, v, err)) return false;
    if (v) {
        if (*v < 0) { err = "bad_value:" + field; return false; }
        out = std::chrono::milliseconds(*v);
    }
    return true;
}

bool parse_rs485(const json& j, LinkConfig& cfg, std::string& err) {
    if (j.is_boolean()) {
        cfg.rs485 = j.get<bool>();
        return true;
    }
    if (!j.is_object()) { err = "bad_value:rs485"; return false; }

    if (!get_to(j, "enabled", "rs485.enabled", cfg.rs485, err)) return false;
    std::optional<int> addr;
    if (!get_opt(j, "address", "rs485.address", addr, err)) return false;
    if (addr) cfg.address = addr;

    RtsTiming t = cfg.rts_timing();
    bool touched = false;
    for (const char* k : {"rts_tx_level", "rts_rx_level", "before_tx_ms", "before_rx_ms", "settle_ms"}) {
        if (j.contains(k)) touched = true;
    }
    if (!get_to(j, "rts_tx_level", "rs485.rts_tx_level", t.tx_level, err)) return false;
    if (!get_to(j, "rts_rx_level", "rs485.rts_rx_level", t.rx_level, err)) return false;
    if (!get_ms(j, "before_tx_ms", "rs485.before_tx_ms", t.before_tx, err)) return false;
    if (!get_ms(j, "before_rx_ms", "rs485.before_rx_ms", t.before_rx, err)) return false;
    if (!get_ms(j, "settle_ms", "rs485.settle_ms", t.settle, err)) return false;
    if (touched) cfg.rts = t;
    return true;
}

bool parse_simulator(const json& j, SimulatorOptions& sim, std::string& err) {
    if (!j.is_object()) { err = "bad_value:simulator"; return false; }
    if (!get_to(j, "enabled", "simulator.enabled", sim.enabled, err)) return false;
    if (!get_to(j, "noise_fraction", "simulator.noise_fraction", sim.noise_fraction, err)) return false;
    if (!get_ms(j, "response_delay_ms", "simulator.response_delay_ms", sim.response_delay, err)) return false;
    if (!get_to(j, "error_probability", "simulator.error_probability", sim.error_probability, err)) return false;
    if (!get_to(j, "seed", "simulator.seed", sim.seed, err)) return false;
    return true;
}

} // namespace

// ---------------------------------------------------------------------------
// LinkConfig
// ---------------------------------------------------------------------------
SerialParams LinkConfig::serial_params() const {
    SerialParams p = model_info(model).serial;
    if (baud) p.baud = *baud;
    if (timeout) {
        p.timeout = *timeout;
        p.write_timeout = *timeout;
    }
    return p;
}

RtsTiming LinkConfig::rts_timing() const {
    return rts ? *rts : model_info(model).rts;
}

int LinkConfig::effective_address() const {
    return address ? *address : model_info(model).default_address;
}

OutputFormat LinkConfig::output_format() const {
    return format ? *format : model_info(model).default_format;
}

// ---------------------------------------------------------------------------
// parse_config()
// --------------
// "model" is applied first so RS485 timing defaults come from the right
// model when the file only overrides part of them.
// ---------------------------------------------------------------------------
bool parse_config(const std::string& text, LinkConfig& cfg, std::string& err) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) { err = "parse_error:invalid_json"; return false; }
    if (!j.is_object())   { err = "parse_error:expected_object"; return false; }

    std::optional<std::string> model;
    if (!get_opt(j, "model", "model", model, err)) return false;
    if (model && !model_from_name(*model, cfg.model)) { err = "bad_value:model"; return false; }

    if (!get_to(j, "port", "port", cfg.port, err)) return false;

    std::optional<int> baud;
    if (!get_opt(j, "baud", "baud", baud, err)) return false;
    if (baud) cfg.baud = baud;

    if (!get_to(j, "auto_baud", "auto_baud", cfg.auto_baud, err)) return false;

    std::chrono::milliseconds ms{0};
    if (j.contains("timeout_ms")) {
        if (!get_ms(j, "timeout_ms", "timeout_ms", ms, err)) return false;
        cfg.timeout = ms;
    }
    if (!get_ms(j, "poll_interval_ms", "poll_interval_ms", cfg.poll_interval, err)) return false;

    std::optional<std::string> fmt;
    if (!get_opt(j, "format", "format", fmt, err)) return false;
    if (fmt) {
        OutputFormat f;
        if (!output_format_from_name(*fmt, f)) { err = "bad_value:format"; return false; }
        cfg.format = f;
    }

    std::optional<std::string> lvl;
    if (!get_opt(j, "log_level", "log_level", lvl, err)) return false;
    if (lvl && !log::level_from_name(*lvl, cfg.log_level)) { err = "bad_value:log_level"; return false; }

    auto rs = j.find("rs485");
    if (rs != j.end() && !parse_rs485(*rs, cfg, err)) return false;

    auto sim = j.find("simulator");
    if (sim != j.end() && !parse_simulator(*sim, cfg.simulator, err)) return false;

    return true;
}

bool load_config_file(const std::string& path, LinkConfig& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) { err = "config_unreadable:" + path; return false; }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_config(ss.str(), cfg, err);
}

bool validate_config(const LinkConfig& cfg, std::string& err) {
    const ModelInfo& info = model_info(cfg.model);

    if (cfg.port.empty() && !cfg.simulator.enabled) { err = "bad_value:port"; return false; }
    if (cfg.rs485 && !info.rs485_capable) { err = "bad_value:rs485"; return false; }
    if (cfg.address) {
        if (*cfg.address < 1 || *cfg.address > info.max_address) { err = "bad_value:address"; return false; }
    }
    if (cfg.baud && !is_line_rate(*cfg.baud)) { err = "bad_value:baud"; return false; }
    if (cfg.timeout && cfg.timeout->count() <= 0) { err = "bad_value:timeout_ms"; return false; }
    if (cfg.poll_interval.count() <= 0) { err = "bad_value:poll_interval_ms"; return false; }

    const SimulatorOptions& s = cfg.simulator;
    if (s.noise_fraction < 0.0 || s.noise_fraction > 1.0) {
        err = "bad_value:simulator.noise_fraction";
        return false;
    }
    if (s.error_probability < 0.0 || s.error_probability > 1.0) {
        err = "bad_value:simulator.error_probability";
        return false;
    }
    return true;
}

std::string config_to_json(const LinkConfig& cfg) {
    const SerialParams sp = cfg.serial_params();
    const RtsTiming rts = cfg.rts_timing();

    json j;
    j["port"] = cfg.port;
    j["model"] = model_name(cfg.model);
    j["baud"] = sp.baud;
    j["auto_baud"] = cfg.auto_baud;
    j["timeout_ms"] = sp.timeout.count();
    j["format"] = output_format_name(cfg.output_format());
    j["poll_interval_ms"] = cfg.poll_interval.count();
    j["log_level"] = log::level_name(cfg.log_level);
    j["rs485"] = {
        {"enabled", cfg.rs485},
        {"address", cfg.effective_address()},
        {"rts_tx_level", rts.tx_level},
        {"rts_rx_level", rts.rx_level},
        {"before_tx_ms", rts.before_tx.count()},
        {"before_rx_ms", rts.before_rx.count()},
        {"settle_ms", rts.settle.count()},
    };
    j["simulator"] = {
        {"enabled", cfg.simulator.enabled},
        {"noise_fraction", cfg.simulator.noise_fraction},
        {"response_delay_ms", cfg.simulator.response_delay.count()},
        {"error_probability", cfg.simulator.error_probability},
        {"seed", cfg.simulator.seed},
    };
    return j.dump(2);
}

} // namespace gaugelink

/**
 * @file main.cpp
 * @brief gaugelink CLI - one-shot runner around gaugelink::DeviceLink.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and merge them over an optional JSON config file.
 *  - Open exactly one link (serial or --simulate) and run exactly one action:
 *    --get, --set, --action, --raw, --probe or --watch.
 *  - Print one "status=ok key=value" line per response, or one JSON object
 *    per line with --json. Errors go to stderr as "status=error reason=...".
 *
 * Exit codes:
 *  - 0 ok
 *  - 2 usage (bad option, bad value, unknown command, unconvertible --raw text)
 *  - 3 connection (port cannot be opened, link dropped)
 *  - 4 device or protocol failure (timeout, NAK, checksum, framing)
 *
 * Notes:
 *  - --list-models and --list-commands need no device.
 *  - --raw input is classified automatically (binary, hex, decimal, ASCII). Without
 *    --format the reply is shown in the format suggested for its bytes.
 *  - --watch N collects N continuous-poll results through a bounded queue,
 *    then stops the poller before exiting.
 */

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "gaugelink/command_catalog.hpp"
#include "gaugelink/config.hpp"
#include "gaugelink/device_link.hpp"
#include "gaugelink/log.hpp"
#include "gaugelink/manual_command.hpp"
#include "gaugelink/poll_queue.hpp"

using json = nlohmann::json;
using namespace gaugelink;

// ---------- small utilities ----------

static std::string quoted(const std::string& v) {
  if (!v.empty() && v.find_first_of(" \t\"=") == std::string::npos) return v;
  std::string out = "\"";
  for (char c : v) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

static const char* codec_name(CodecKind k) {
  switch (k) {
    case CodecKind::PfeifferBinary: return "pfeiffer_binary";
    case CodecKind::Capacitance:    return "capacitance";
    case CodecKind::AsciiMnemonic:  return "ascii_mnemonic";
    case CodecKind::TurboAscii:     return "turbo_ascii";
  }
  return "unknown";
}

static int exit_code_for(ErrorKind k) {
  switch (k) {
    case ErrorKind::None:        return 0;
    case ErrorKind::Connection:  return 3;
    case ErrorKind::Encode:
    case ErrorKind::Conversion:
    case ErrorKind::CallerError: return 2;
    default:                     return 4;
  }
}

static json response_json(const DeviceResponse& r, const std::string& command) {
  json j;
  j["status"] = r.success ? "ok" : "error";
  j["command"] = command;
  if (r.success) {
    j["result"] = r.formatted;
    j["values"] = r.values;
  } else {
    j["reason"] = r.error;
    j["kind"] = error_kind_name(r.kind);
  }
  j["raw"] = r.display;
  return j;
}

static int print_response(const DeviceResponse& r, const std::string& command, bool as_json) {
  if (as_json) {
    std::cout << response_json(r, command).dump() << "\n";
    return exit_code_for(r.success ? ErrorKind::None : r.kind);
  }
  if (r.success) {
    std::cout << "status=ok command=" << quoted(command)
              << " result=" << quoted(r.formatted);
    if (!r.display.empty()) std::cout << " raw=" << quoted(r.display);
    std::cout << "\n";
    return 0;
  }
  std::cerr << "status=error command=" << quoted(command)
            << " kind=" << error_kind_name(r.kind)
            << " reason=" << quoted(r.error);
  if (!r.raw.empty()) std::cerr << " raw=" << quoted(r.display);
  std::cerr << "\n";
  return exit_code_for(r.kind);
}

static void list_models(bool as_json) {
  json arr = json::array();
  for (DeviceModel m : all_models()) {
    const ModelInfo& info = model_info(m);
    if (as_json) {
      arr.push_back({{"model", info.name},
                     {"codec", codec_name(info.codec)},
                     {"baud", info.serial.baud},
                     {"rs485", info.rs485_capable},
                     {"format", output_format_name(info.default_format)}});
      continue;
    }
    std::cout << "model=" << info.name
              << " codec=" << codec_name(info.codec)
              << " baud=" << info.serial.baud
              << " rs485=" << (info.rs485_capable ? 1 : 0)
              << " format=" << quoted(output_format_name(info.default_format)) << "\n";
  }
  if (as_json) std::cout << arr.dump(2) << "\n";
}

static void list_commands(DeviceModel model, bool as_json) {
  const CommandCatalog& cat = catalog_for(model);
  json arr = json::array();
  for (const auto& d : cat.commands()) {
    std::string access = std::string(d.readable ? "r" : "") + (d.writable ? "w" : "");
    if (as_json) {
      json j = {{"name", d.name}, {"id", d.wire_id()}, {"access", access},
                {"type", param_type_name(d.param_type)}, {"description", d.description}};
      if (!d.unit.empty()) j["unit"] = d.unit;
      if (d.min_value) j["min"] = *d.min_value;
      if (d.max_value) j["max"] = *d.max_value;
      if (d.continuous) j["continuous"] = true;
      arr.push_back(j);
      continue;
    }
    std::cout << "name=" << d.name << " id=" << d.wire_id() << " access=" << access;
    if (!d.unit.empty()) std::cout << " unit=" << quoted(d.unit);
    if (!d.range_text().empty()) std::cout << " range=" << d.range_text();
    if (d.continuous) std::cout << " continuous=1";
    std::cout << " desc=" << quoted(d.description) << "\n";
  }
  if (as_json) std::cout << arr.dump(2) << "\n";
}

int main(int argc, char** argv) {
  CLI::App app{"gaugelink - vacuum gauge and turbo pump serial tool"};

  // ---- catalog ----
  bool opt_list_models=false, opt_list_commands=false, show_config=false;

  // ---- actions ----
  std::string get_name, action_name, raw_text;
  std::vector<std::string> set_kv;      // --set <name> <value>
  bool do_probe=false;
  int watch_count=0;

  // ---- link ----
  std::string dev, model_s, format_s, config_path;
  int baud=0, address=0, timeout_ms=0, interval_ms=0;
  bool auto_baud=false, rs485=false, simulate=false;

  // ---- output ----
  bool as_json=false;
  int verbose=0;

  app.add_flag("--list-models", opt_list_models, "List supported device models");
  app.add_flag("--list-commands", opt_list_commands, "List the commands of --model");
  app.add_flag("--show-config", show_config, "Print the effective configuration as JSON");

  app.add_option("--get", get_name, "Query a command by name (e.g. pressure, get_speed)");
  app.add_option("--set", set_kv, "Set a value: --set <name> <value>")->expected(2);
  app.add_option("--action", action_name, "Run a command without value (e.g. zero_adjust)");
  app.add_option("--raw", raw_text, "Send free-form bytes: \"03 00 10 00 10\", \"0x03 0x00\", \"@254PR3?\\\"");
  app.add_flag("--probe", do_probe, "Check that the device answers");
  CLI::Option* opt_watch = app.add_option("--watch", watch_count, "Print N continuous readings")->check(CLI::PositiveNumber);

  CLI::Option* opt_dev    = app.add_option("--dev", dev, "Serial device (e.g. /dev/ttyUSB0)");
  CLI::Option* opt_model  = app.add_option("--model", model_s, "Device model (see --list-models)");
  CLI::Option* opt_baud   = app.add_option("--baud", baud, "Baud rate (default: model rate)");
  app.add_flag("--auto-baud", auto_baud, "Probe standard baud rates until the device answers");
  app.add_flag("--rs485", rs485, "RS485 multidrop with RTS direction control");
  CLI::Option* opt_addr   = app.add_option("--address", address, "RS485 device address");
  CLI::Option* opt_tmo    = app.add_option("--timeout", timeout_ms, "Read timeout (ms)");
  CLI::Option* opt_ivl    = app.add_option("--interval", interval_ms, "Poll interval for --watch (ms)");
  CLI::Option* opt_format = app.add_option("--format", format_s, "Raw display: hex|binary|ascii|utf-8|decimal|raw");
  app.add_option("--config", config_path, "JSON configuration file")->check(CLI::ExistingFile);
  app.add_flag("--simulate", simulate, "Use the built-in device simulator instead of a port");

  app.add_flag("--json", as_json, "One JSON object per response");
  app.add_flag("-v,--verbose", verbose, "Log to stderr (-v info, -vv debug)");

  CLI11_PARSE(app, argc, argv);

  // -------- configuration: file first, then options --------
  LinkConfig cfg;
  std::string err;

  if (!config_path.empty() && !load_config_file(config_path, cfg, err)) {
    std::cerr << "status=error reason=" << err << "\n";
    return 2;
  }
  if (opt_dev->count())   cfg.port = dev;
  if (opt_model->count() && !model_from_name(model_s, cfg.model)) {
    std::cerr << "status=error reason=bad_value:model value=" << quoted(model_s) << "\n";
    return 2;
  }
  if (opt_baud->count())  cfg.baud = baud;
  if (auto_baud)          cfg.auto_baud = true;
  if (rs485)              cfg.rs485 = true;
  if (opt_addr->count())  cfg.address = address;
  if (opt_tmo->count())   cfg.timeout = std::chrono::milliseconds(timeout_ms);
  if (opt_ivl->count())   cfg.poll_interval = std::chrono::milliseconds(interval_ms);
  if (opt_format->count()) {
    OutputFormat f{};
    if (!output_format_from_name(format_s, f)) {
      std::cerr << "status=error reason=bad_value:format value=" << quoted(format_s) << "\n";
      return 2;
    }
    cfg.format = f;
  }
  if (simulate) cfg.simulator.enabled = true;

  log::set_level(cfg.log_level);
  if (verbose == 1) log::set_level(log::Level::Info);
  if (verbose >= 2) log::set_level(log::Level::Debug);

  // -------- offline modes --------
  if (opt_list_models) { list_models(as_json); return 0; }
  if (opt_list_commands) { list_commands(cfg.model, as_json); return 0; }
  if (show_config) {
    if (!validate_config(cfg, err)) { std::cerr << "status=error reason=" << err << "\n"; return 2; }
    std::cout << config_to_json(cfg) << "\n";
    return 0;
  }

  // -------- choose exactly one action --------
  int cmds = 0;
  cmds += (!get_name.empty()) ? 1 : 0;
  cmds += (set_kv.size()==2) ? 1 : 0;
  cmds += (!action_name.empty()) ? 1 : 0;
  cmds += (!raw_text.empty()) ? 1 : 0;
  cmds += do_probe ? 1 : 0;
  cmds += (opt_watch->count() > 0) ? 1 : 0;

  if (cmds != 1) {
    std::cerr << "status=error reason=need_exactly_one_command\n";
    return 2;
  }

  // --raw is converted before the port is touched
  Bytes raw_frame;
  manual::InputFormat raw_kind = manual::InputFormat::Ascii;
  if (!raw_text.empty() && !manual::encode(raw_text, raw_frame, err, &raw_kind)) {
    std::cerr << "status=error reason=" << err << " input=" << manual::input_format_name(raw_kind) << "\n";
    return 2;
  }

  auto link = open_link(cfg, err);
  if (!link) {
    std::cerr << "status=error reason=" << quoted(err) << " dev=" << quoted(cfg.port) << "\n";
    return err.rfind("bad_value:", 0) == 0 ? 2 : 3;
  }

  try {
    if (!get_name.empty()) {
      return print_response(link->send(DeviceCommand::query(get_name)), get_name, as_json);
    }
    if (set_kv.size()==2) {
      return print_response(link->send(DeviceCommand::set(set_kv[0], set_kv[1])), set_kv[0], as_json);
    }
    if (!action_name.empty()) {
      return print_response(link->send(DeviceCommand::action(action_name)), action_name, as_json);
    }
    if (!raw_text.empty()) {
      log::info("raw_input", {{"format", manual::input_format_name(raw_kind)}, {"bytes", hex_upper(raw_frame)}});
      DeviceResponse r = link->send_raw(raw_frame);
      if (!cfg.format && r.success) {
        const OutputFormat shown = manual::suggest_display_format(r.raw);
        r.formatted = format_bytes(r.raw, shown);
        r.display = r.formatted;
      }
      return print_response(r, "raw", as_json);
    }
    if (do_probe) {
      return print_response(link->probe(), "probe", as_json);
    }
  } catch (const UnknownCommand& e) {
    std::cerr << "status=error reason=unknown_command name=" << quoted(e.command())
              << " model=" << model_name(link->model()) << "\n";
    return 2;
  }

  // -------- watch: continuous polling through a bounded queue --------
  const CommandDefinition* cont = link->catalog().continuous_command();
  const std::string watch_name = cont ? cont->name : "continuous";

  PollQueue<64> queue;
  if (!link->start_continuous(cfg.poll_interval, [&queue](const DeviceResponse& r) { queue.push(r); }, err)) {
    std::cerr << "status=error reason=" << err << "\n";
    return 2;
  }

  // One interval plus one read timeout is the longest a step can take.
  const auto wait = cfg.poll_interval + cfg.serial_params().timeout + std::chrono::milliseconds(500);
  int rc = 0;
  for (int i = 0; i < watch_count; ++i) {
    DeviceResponse r;
    if (!queue.pop_for(r, wait)) {
      std::cerr << "status=error reason=watch_timeout received=" << i << "\n";
      rc = 4;
      break;
    }
    int one = print_response(r, watch_name, as_json);
    if (one != 0) rc = one;
  }

  if (!link->stop_continuous()) log::warn("poll_stop_slow", {{"dev", cfg.port}});
  if (queue.dropped() > 0) log::info("watch_dropped", {{"count", std::to_string(queue.dropped())}});
  link->disconnect();
  return rc;
}

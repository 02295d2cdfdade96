#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include "gaugelink/config.hpp"

using namespace gaugelink;
using json = nlohmann::json;

TEST_CASE("Config keys merge into the defaults") {
    LinkConfig cfg;
    std::string err;
    REQUIRE(parse_config(R"({
        "port": "/dev/ttyUSB3",
        "model": "MPG500",
        "baud": 115200,
        "timeout_ms": 1500,
        "format": "decimal",
        "log_level": "debug",
        "rs485": {"enabled": true, "address": 12, "before_tx_ms": 4},
        "simulator": {"noise_fraction": 0.05, "seed": 7}
    })", cfg, err));

    CHECK(cfg.port == "/dev/ttyUSB3");
    CHECK(cfg.model == DeviceModel::MPG500);
    CHECK(cfg.serial_params().baud == 115200);
    CHECK(cfg.serial_params().timeout == std::chrono::milliseconds(1500));
    CHECK(cfg.output_format() == OutputFormat::Decimal);
    CHECK(cfg.log_level == log::Level::Debug);
    CHECK(cfg.rs485);
    CHECK(cfg.effective_address() == 12);
    CHECK(cfg.rts_timing().before_tx == std::chrono::milliseconds(4));
    CHECK(cfg.rts_timing().before_rx == std::chrono::milliseconds(2));
    CHECK(cfg.simulator.seed == 7u);
    CHECK(validate_config(cfg, err));
}

TEST_CASE("Absent keys fall back to the model table") {
    LinkConfig cfg;
    std::string err;
    REQUIRE(parse_config(R"({"model": "TC600", "port": "/dev/ttyS0"})", cfg, err));
    CHECK(cfg.serial_params().baud == 9600);
    CHECK(cfg.effective_address() == 1);
    CHECK(cfg.rts_timing().before_tx == std::chrono::milliseconds(5));
    CHECK(cfg.output_format() == OutputFormat::Ascii);
}

TEST_CASE("Wrongly typed or unknown values name the field") {
    LinkConfig cfg;
    std::string err;

    CHECK_FALSE(parse_config(R"({"baud": "fast"})", cfg, err));
    CHECK(err == "bad_value:baud");
    CHECK_FALSE(parse_config(R"({"model": "XYZ9000"})", cfg, err));
    CHECK(err == "bad_value:model");
    CHECK_FALSE(parse_config(R"({"format": "octal"})", cfg, err));
    CHECK(err == "bad_value:format");
    CHECK_FALSE(parse_config(R"({"rs485": {"address": "one"}})", cfg, err));
    CHECK(err == "bad_value:rs485.address");
    CHECK_FALSE(parse_config(R"({"timeout_ms": -5})", cfg, err));
    CHECK(err == "bad_value:timeout_ms");
    CHECK_FALSE(parse_config("{not json", cfg, err));
    CHECK(err == "parse_error:invalid_json");
    CHECK_FALSE(parse_config("[1, 2]", cfg, err));
    CHECK(err == "parse_error:expected_object");
}

TEST_CASE("Cross-field validation") {
    std::string err;
    LinkConfig cfg;
    cfg.port = "/dev/ttyUSB0";
    REQUIRE(validate_config(cfg, err));

    LinkConfig no_port;
    CHECK_FALSE(validate_config(no_port, err));
    CHECK(err == "bad_value:port");
    no_port.simulator.enabled = true;
    CHECK(validate_config(no_port, err));

    LinkConfig cdg = cfg;
    cdg.model = DeviceModel::CDG045D;
    cdg.rs485 = true;
    CHECK_FALSE(validate_config(cdg, err));
    CHECK(err == "bad_value:rs485");

    LinkConfig addr = cfg;
    addr.address = 255;
    CHECK_FALSE(validate_config(addr, err));
    CHECK(err == "bad_value:address");
    addr.model = DeviceModel::TC600;
    CHECK(validate_config(addr, err));

    LinkConfig baud = cfg;
    baud.baud = 12345;
    CHECK_FALSE(validate_config(baud, err));
    CHECK(err == "bad_value:baud");

    LinkConfig sim = cfg;
    sim.simulator.error_probability = 1.5;
    CHECK_FALSE(validate_config(sim, err));
    CHECK(err == "bad_value:simulator.error_probability");
}

TEST_CASE("Effective configuration dumps as JSON") {
    LinkConfig cfg;
    cfg.port = "/dev/ttyUSB0";
    cfg.model = DeviceModel::PPG570;
    const json j = json::parse(config_to_json(cfg));
    CHECK(j["model"] == "PPG570");
    CHECK(j["baud"] == 9600);
    CHECK(j["format"] == "ASCII");
    CHECK(j["rs485"]["address"] == 254);
    CHECK(j["simulator"]["enabled"] == false);
}

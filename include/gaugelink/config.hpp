#pragma once
/**
 * @file config.hpp
 * @brief Link configuration: which device, which port, which line settings.
 *
 * @details
 * PURPOSE
 * -------
 * LinkConfig is everything open_link() needs. It can be filled from a JSON
 * file and then overridden field by field from the command line. Fields that
 * are left unset fall back to the model's defaults from device_family.hpp.
 *
 * FILE FORMAT
 * -----------
 * @code
 *   {
 *     "port": "/dev/ttyUSB0",
 *     "model": "PCG550",
 *     "baud": 57600,
 *     "auto_baud": false,
 *     "timeout_ms": 1000,
 *     "format": "Hex",
 *     "poll_interval_ms": 500,
 *     "log_level": "info",
 *     "rs485": { "enabled": true, "address": 3,
 *                "rts_tx_level": true, "rts_rx_level": false,
 *                "before_tx_ms": 2, "before_rx_ms": 2, "settle_ms": 0 },
 *     "simulator": { "enabled": false, "noise_fraction": 0.02,
 *                    "response_delay_ms": 0, "error_probability": 0.0, "seed": 1 }
 *   }
 * @endcode
 *
 * Every key is optional. Errors are reported as "bad_value:<field>" (wrong
 * type or illegal value) or "parse_error:<detail>" (not JSON at all).
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "gaugelink/device_family.hpp"
#include "gaugelink/log.hpp"
#include "gaugelink/output_format.hpp"

namespace gaugelink {

struct SimulatorOptions {
    bool enabled{false};
    double noise_fraction{0.02};
    std::chrono::milliseconds response_delay{0};
    double error_probability{0.0};
    uint32_t seed{1};
};

struct LinkConfig {
    std::string port;
    DeviceModel model{DeviceModel::PCG550};
    std::optional<int> baud;
    bool auto_baud{false};
    bool rs485{false};
    std::optional<int> address;
    std::optional<RtsTiming> rts;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<OutputFormat> format;
    std::chrono::milliseconds poll_interval{1000};
    log::Level log_level{log::Level::Warn};
    SimulatorOptions simulator;

    /// Model line parameters with the baud and timeout overrides applied.
    SerialParams serial_params() const;

    RtsTiming rts_timing() const;

    /// Configured address, else the model's default multidrop address.
    int effective_address() const;

    OutputFormat output_format() const;
};

/// Merge the keys present in @p text into @p cfg.
bool parse_config(const std::string& text, LinkConfig& cfg, std::string& err);

/// Read @p path and merge it into @p cfg.
bool load_config_file(const std::string& path, LinkConfig& cfg, std::string& err);

/**
 * @brief Cross-field checks run after file and command line are merged.
 *
 * Rejects: RS485 on a model without it, address outside 1..max_address,
 * non-standard baud, non-positive timeout or poll interval, simulator
 * probabilities outside 0..1.
 */
bool validate_config(const LinkConfig& cfg, std::string& err);

/// Effective configuration as pretty-printed JSON.
std::string config_to_json(const LinkConfig& cfg);

} // namespace gaugelink

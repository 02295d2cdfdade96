#pragma once
/**
 * @file command_catalog.hpp
 * @brief Per-family command tables: name -> wire id, capability, type, range.
 *
 * @details
 * PURPOSE
 * -------
 * A catalog is the only place that knows what "pressure" means on a given
 * device: a Pfeiffer parameter id (221), an INFICON register address (0xDD),
 * an MKS mnemonic ("PR3") or a turbo parameter number (309). Codecs look the
 * command up by name and build the frame from the definition.
 *
 * LIFETIME
 * --------
 * Catalogs are built once on first use, never mutated, and returned by const
 * reference. Any number of codecs and transports for the same family share
 * the same instance.
 *
 * EXAMPLE
 * -------
 * @code
 *   const auto& cat = gaugelink::catalog_for(gaugelink::DeviceModel::TC600);
 *   const auto& def = cat.at("set_speed");    // throws UnknownCommand if absent
 *   // def.pid == 308, def.writable, def.min_value == 0, def.max_value == 100
 * @endcode
 */

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "gaugelink/device_family.hpp"
#include "gaugelink/param_codec.hpp"

namespace gaugelink {

/// INFICON service byte of a capacitance-gauge command.
enum class ServiceCode : uint8_t { Read = 0x00, Write = 0x10, Special = 0x40 };

struct CommandDefinition {
    uint16_t pid{0};                ///< parameter id / register address
    std::string mnemonic;           ///< ASCII mnemonic (AsciiMnemonic family)
    std::string name;
    std::string description;
    bool readable{true};
    bool writable{false};
    bool continuous{false};         ///< polled by start_continuous()
    ParamType param_type{};
    std::optional<double> min_value;
    std::optional<double> max_value;
    std::string unit;
    ServiceCode service{ServiceCode::Read};

    /// "221", "0xDD" style ids are rendered as decimal; mnemonics verbatim.
    std::string wire_id() const;

    /// True when no range is declared or @p v lies inside it.
    bool in_range(double v) const;

    /// "(0..100)" style bound description, empty when unbounded.
    std::string range_text() const;
};

class CommandCatalog {
public:
    CommandCatalog(std::string family, std::vector<CommandDefinition> defs);

    const std::string& family() const { return family_; }
    const std::vector<CommandDefinition>& commands() const { return defs_; }
    std::size_t size() const { return defs_.size(); }

    /// nullptr when @p name is not in the catalog.
    const CommandDefinition* find(const std::string& name) const;

    /// Same as find() but throws UnknownCommand.
    const CommandDefinition& at(const std::string& name) const;

    /// First definition flagged continuous, nullptr if the family has none.
    const CommandDefinition* continuous_command() const;

private:
    std::string family_;
    std::vector<CommandDefinition> defs_;
    std::map<std::string, std::size_t> index_;
};

/// Shared immutable catalog for @p model.
const CommandCatalog& catalog_for(DeviceModel model);

} // namespace gaugelink

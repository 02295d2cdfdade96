// ============================================================================
// command_catalog.cpp - command tables for command_catalog.hpp
//
// One builder per family. Each table is built once inside catalog_for() and
// handed out by const reference afterwards.
// ============================================================================

#include "gaugelink/command_catalog.hpp"

#include <sstream>

namespace gaugelink {

// ---------------------------------------------------------------------------
// CommandDefinition
// ---------------------------------------------------------------------------
std::string CommandDefinition::wire_id() const {
    if (!mnemonic.empty()) return mnemonic;
    return std::to_string(pid);
}

bool CommandDefinition::in_range(double v) const {
    if (min_value && v < *min_value) return false;
    if (max_value && v > *max_value) return false;
    return true;
}

std::string CommandDefinition::range_text() const {
    if (!min_value && !max_value) return {};
    std::ostringstream os;
    os << "(";
    if (min_value) os << *min_value;
    os << "..";
    if (max_value) os << *max_value;
    os << ")";
    return os.str();
}

// ---------------------------------------------------------------------------
// CommandCatalog
// ---------------------------------------------------------------------------
CommandCatalog::CommandCatalog(std::string family, std::vector<CommandDefinition> defs)
: family_(std::move(family)), defs_(std::move(defs)) {
    for (std::size_t i = 0; i < defs_.size(); ++i) index_.emplace(defs_[i].name, i);
}

const CommandDefinition* CommandCatalog::find(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : &defs_[it->second];
}

const CommandDefinition& CommandCatalog::at(const std::string& name) const {
    const CommandDefinition* d = find(name);
    if (!d) throw UnknownCommand(name);
    return *d;
}

const CommandDefinition* CommandCatalog::continuous_command() const {
    for (const auto& d : defs_) {
        if (d.continuous) return &d;
    }
    return nullptr;
}

// ============================================================================
// Builders
// ============================================================================
namespace {

// Read-only parameter addressed by number.
CommandDefinition rd(uint16_t pid, const char* name, const char* desc,
                     ParamType type, const char* unit = "") {
    CommandDefinition d;
    d.pid = pid;
    d.name = name;
    d.description = desc;
    d.readable = true;
    d.writable = false;
    d.param_type = type;
    d.unit = unit;
    return d;
}

// Write-only action or setting addressed by number.
CommandDefinition wr(uint16_t pid, const char* name, const char* desc,
                     ParamType type = ParamType::none(), const char* unit = "") {
    CommandDefinition d = rd(pid, name, desc, type, unit);
    d.readable = false;
    d.writable = true;
    return d;
}

// Read/write parameter addressed by number.
CommandDefinition rw(uint16_t pid, const char* name, const char* desc,
                     ParamType type, const char* unit = "") {
    CommandDefinition d = rd(pid, name, desc, type, unit);
    d.writable = true;
    return d;
}

CommandDefinition ranged(CommandDefinition d, double lo, double hi) {
    d.min_value = lo;
    d.max_value = hi;
    return d;
}

CommandDefinition continuous(CommandDefinition d) {
    d.continuous = true;
    return d;
}

CommandDefinition service(CommandDefinition d, ServiceCode s) {
    d.service = s;
    return d;
}

CommandDefinition mnemonic(CommandDefinition d, const char* m) {
    d.mnemonic = m;
    return d;
}

const ParamType kText = ParamType::ascii(32);

// ---------------------------------------------------------------------------
// Pfeiffer binary family. Parameter ids are shared across models; only the
// pressure encoding and the model-specific extras differ.
// ---------------------------------------------------------------------------
std::vector<CommandDefinition> pfeiffer_common(ParamType pressure) {
    return {
        continuous(rd(221, "pressure", "Read pressure measurement", pressure, "mbar")),
        rd(222, "temperature", "Read sensor temperature", ParamType::float32(), "C"),
        rd(207, "serial_number", "Read serial number", kText),
        rd(218, "software_version", "Read software version", kText),
        rd(228, "error_status", "Read device error status", ParamType::u16()),
    };
}

CommandCatalog build_pcg550() {
    auto v = pfeiffer_common(ParamType::fixed_en20());
    v.push_back(rd(208, "product_name", "Read product name", kText));
    v.push_back(rd(104, "run_hours", "Read operating hours", ParamType::u32(), "h"));
    v.push_back(wr(417, "zero_adjust", "Perform zero adjustment"));
    return CommandCatalog("PCG550", std::move(v));
}

CommandCatalog build_psg550() {
    auto v = pfeiffer_common(ParamType::fixed_en20());
    v.push_back(rd(208, "product_name", "Read product name", kText));
    v.push_back(rd(104, "run_hours", "Read operating hours", ParamType::u32(), "h"));
    v.push_back(rd(33000, "pirani_full_scale", "Read Pirani full scale", ParamType::fixed_en20(), "mbar"));
    v.push_back(wr(417, "pirani_adjust", "Execute Pirani adjustment"));
    return CommandCatalog("PSG550", std::move(v));
}

CommandCatalog build_mag500() {
    auto v = pfeiffer_common(ParamType::log_fixed_en26());
    v.push_back(rd(208, "product_name", "Read product name", kText));
    v.push_back(rd(104, "run_hours", "Read operating hours", ParamType::u32(), "h"));
    v.push_back(rd(533, "ccig_status", "CCIG status (0=off, 1=on not ignited, 3=on and ignited)", ParamType::u8()));
    v.push_back(wr(529, "ccig_control", "Switch CCIG on/off", ParamType::boolean()));
    v.push_back(rd(503, "ccig_full_scale", "Read CCIG full scale", ParamType::log_fixed_en26(), "mbar"));
    v.push_back(rd(504, "ccig_safe_state", "Read CCIG safe state", ParamType::u8()));
    return CommandCatalog("MAG500", std::move(v));
}

CommandCatalog build_mpg500() {
    auto v = pfeiffer_common(ParamType::log_fixed_en26());
    v.push_back(rd(208, "product_name", "Read product name", kText));
    v.push_back(rd(104, "run_hours", "Read operating hours", ParamType::u32(), "h"));
    v.push_back(rd(223, "active_sensor", "Current active sensor (1=CCIG, 2=Pirani, 3=Mixed)", ParamType::u8()));
    v.push_back(rd(33000, "pirani_full_scale", "Read Pirani full scale", ParamType::log_fixed_en26(), "mbar"));
    v.push_back(wr(418, "pirani_adjust", "Execute Pirani adjustment"));
    return CommandCatalog("MPG500", std::move(v));
}

CommandCatalog build_bpg40x() {
    auto v = pfeiffer_common(ParamType::log_fixed_en26());
    v.push_back(rd(533, "emission_status", "Get emission status", ParamType::u8()));
    v.push_back(wr(529, "degas", "Control degas function", ParamType::boolean()));
    return CommandCatalog("BPG40x", std::move(v));
}

CommandCatalog build_bpg552() {
    auto v = pfeiffer_common(ParamType::log_fixed_en26());
    v.push_back(wr(417, "zero_adjust", "Perform zero adjustment"));
    v.push_back(rd(533, "emission_status", "Get emission status", ParamType::u8()));
    v.push_back(wr(529, "degas", "Control degas function", ParamType::boolean()));
    v.push_back(rw(530, "emission_current", "Get/set emission current", ParamType::u8()));
    return CommandCatalog("BPG552", std::move(v));
}

CommandCatalog build_bcg450() {
    auto v = pfeiffer_common(ParamType::log_fixed_en26());
    v.push_back(rd(223, "sensor_status", "Get active sensor status", ParamType::u8()));
    v.push_back(wr(418, "pirani_adjust", "Execute Pirani adjustment"));
    v.push_back(wr(529, "ba_degas", "Control BA degas", ParamType::boolean()));
    return CommandCatalog("BCG450", std::move(v));
}

CommandCatalog build_bcg552() {
    auto v = pfeiffer_common(ParamType::log_fixed_en26());
    v.push_back(wr(417, "zero_adjust", "Perform zero adjustment"));
    return CommandCatalog("BCG552", std::move(v));
}

// ---------------------------------------------------------------------------
// Capacitance gauges. pid holds the register address byte. Queries go out
// with the read service and Sets with the write service, unless the entry is
// marked Special.
// ---------------------------------------------------------------------------
CommandCatalog build_cdg(const char* family) {
    std::vector<CommandDefinition> v{
        continuous(rd(0xDD, "pressure", "Read pressure", ParamType::none(), "mbar")),
        rd(0xDE, "temperature", "Read temperature status", ParamType::none()),
        service(wr(0x02, "zero_adjust", "Perform zero adjustment"), ServiceCode::Special),
        rd(0x03, "full_scale", "Read full scale", ParamType::u8()),
        rd(0x10, "software_version", "Read software version", ParamType::u8()),
        ranged(rw(0x01, "unit", "Pressure unit (0=mbar, 1=Torr, 2=Pa)", ParamType::u8()), 0, 2),
        ranged(rw(0x02, "filter", "Filter mode (0=dynamic, 1=fast, 2=slow)", ParamType::u8()), 0, 2),
        rd(59, "cdg_type", "Read gauge type", ParamType::u8()),
    };
    return CommandCatalog(family, std::move(v));
}

// ---------------------------------------------------------------------------
// MKS-style ASCII gauges.
// ---------------------------------------------------------------------------
CommandCatalog build_ppg(bool with_atm) {
    std::vector<CommandDefinition> v{
        continuous(mnemonic(rd(0, "pressure", "Read combined pressure measurement", kText, "mbar"), "PR3")),
        mnemonic(rd(0, "pirani_pressure", "Read Pirani pressure", kText, "mbar"), "PR1"),
        mnemonic(rd(0, "piezo_pressure", "Read Piezo pressure", kText, "mbar"), "PR2"),
        mnemonic(rd(0, "temperature", "Read temperature", kText, "C"), "T"),
        mnemonic(rd(0, "software_version", "Read firmware version", kText), "FV"),
        mnemonic(rd(0, "serial_number", "Read serial number", kText), "SN"),
        mnemonic(rw(0, "unit", "Get/set pressure unit", kText), "U"),
        mnemonic(wr(0, "zero_adjust", "Perform Pirani zero adjustment"), "VAC"),
        mnemonic(wr(0, "piezo_adjust", "Perform Piezo full scale adjustment"), "FS"),
    };
    if (with_atm) {
        v.push_back(mnemonic(rd(0, "atm_pressure", "Read atmospheric pressure", kText, "mbar"), "PR4"));
        v.push_back(mnemonic(rd(0, "differential_pressure", "Read differential pressure", kText, "mbar"), "PR5"));
        v.push_back(mnemonic(wr(0, "atm_zero", "Perform atmospheric sensor zero adjustment"), "ATZ"));
        v.push_back(mnemonic(wr(0, "atm_adjust", "Perform atmospheric sensor adjustment"), "ATD"));
    }
    return CommandCatalog(with_atm ? "PPG570" : "PPG550", std::move(v));
}

// ---------------------------------------------------------------------------
// TC600 turbo controller. Settings are readable back, so writable entries are
// rw() rather than wr().
// ---------------------------------------------------------------------------
CommandCatalog build_tc600() {
    const ParamType b = ParamType::ascii_boolean_old();
    const ParamType ui = ParamType::ascii_u_integer();
    const ParamType ur = ParamType::ascii_u_real();
    const ParamType s6 = ParamType::ascii(6);
    std::vector<CommandDefinition> v{
        rw(23, "motor_on", "Switch motor/pump on or off", b),
        continuous(rd(309, "get_speed", "Read turbo rotation speed", ui, "rpm")),
        ranged(rw(308, "set_speed", "Set the turbo rotation speed (percent of max)", ui, "%"), 0, 100),
        rd(310, "get_current", "Read motor current", ur, "A"),
        rd(316, "get_power", "Read drive power", ui, "W"),
        rd(326, "get_temp_electronic", "Read electronics temperature", ui, "C"),
        rd(330, "get_temp_motor", "Read motor temperature", ui, "C"),
        rd(342, "get_temp_bearing", "Read bearing temperature", ui, "C"),
        rd(303, "get_error", "Read current error code", ui),
        rd(305, "get_warning", "Read current warning status", ui),
        rd(311, "operating_hours", "Read total operating hours", ui, "h"),
        ranged(rw(700, "set_runup_time", "Set maximum run-up time before reaching nominal speed", ui, "s"), 1, 1200),
        ranged(rw(707, "standby_speed", "Set standby rotation speed", ui, "%"), 0, 100),
        ranged(rw(30, "vent_mode", "Venting valve mode (0=closed, 1=controlled, 2=open)", ui), 0, 2),
        ranged(rw(721, "vent_time", "Set venting duration", ui, "s"), 1, 3600),
        rd(312, "firmware_version", "Read firmware version string", s6),
        rd(369, "pump_type", "Read pump type", s6),
        ranged(rw(797, "station_number", "Set station number/address", ui), 1, 255),
        ranged(rw(798, "baud_rate", "Set communication baud rate", ui), 9600, 38400),
        ranged(rw(794, "interface_type", "Set interface type (0=RS232, 1=RS485)", ui), 0, 1),
    };
    return CommandCatalog("TC600", std::move(v));
}

} // namespace

const CommandCatalog& catalog_for(DeviceModel model) {
    static const CommandCatalog pcg550 = build_pcg550();
    static const CommandCatalog psg550 = build_psg550();
    static const CommandCatalog mag500 = build_mag500();
    static const CommandCatalog mpg500 = build_mpg500();
    static const CommandCatalog bpg40x = build_bpg40x();
    static const CommandCatalog bpg552 = build_bpg552();
    static const CommandCatalog bcg450 = build_bcg450();
    static const CommandCatalog bcg552 = build_bcg552();
    static const CommandCatalog cdg    = build_cdg("CDG");
    static const CommandCatalog ppg550 = build_ppg(false);
    static const CommandCatalog ppg570 = build_ppg(true);
    static const CommandCatalog tc600  = build_tc600();

    switch (model) {
        case DeviceModel::PCG550:  return pcg550;
        case DeviceModel::PSG550:  return psg550;
        case DeviceModel::MAG500:  return mag500;
        case DeviceModel::MPG500:  return mpg500;
        case DeviceModel::BPG40x:  return bpg40x;
        case DeviceModel::BPG552:  return bpg552;
        case DeviceModel::BCG450:  return bcg450;
        case DeviceModel::BCG552:  return bcg552;
        case DeviceModel::CDGxxxD:
        case DeviceModel::CDG025D:
        case DeviceModel::CDG045D:
        case DeviceModel::CDG100D:
        case DeviceModel::CDG160D:
        case DeviceModel::CDG200D: return cdg;
        case DeviceModel::PPG550:  return ppg550;
        case DeviceModel::PPG570:  return ppg570;
        case DeviceModel::TC600:   return tc600;
    }
    return pcg550;
}

} // namespace gaugelink

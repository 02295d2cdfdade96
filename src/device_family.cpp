// ============================================================================
// device_family.cpp - model table for device_family.hpp
// ============================================================================

#include "gaugelink/device_family.hpp"

#include <algorithm>
#include <cctype>

namespace gaugelink {

namespace {

using std::chrono::milliseconds;

constexpr SerialParams line(int baud) {
    return SerialParams{baud, 8, Parity::None, 1, milliseconds(1000), milliseconds(1000)};
}

constexpr RtsTiming kGaugeRts{true, false, milliseconds(2), milliseconds(2), milliseconds(0)};
constexpr RtsTiming kTurboRts{true, false, milliseconds(5), milliseconds(5), milliseconds(0)};

// Order must follow the DeviceModel enumerators.
const ModelInfo kModels[] = {
    // model               name       codec                       id    serial       rs485  addr max  format                 errors                   stream rts
    {DeviceModel::PCG550,  "PCG550",  CodecKind::PfeifferBinary,  0x02, line(57600), true,  1,  254, OutputFormat::Hex,   ErrorBitLayout::Standard, false, kGaugeRts},
    {DeviceModel::PSG550,  "PSG550",  CodecKind::PfeifferBinary,  0x02, line(57600), true,  1,  254, OutputFormat::Hex,   ErrorBitLayout::Standard, false, kGaugeRts},
    {DeviceModel::MAG500,  "MAG500",  CodecKind::PfeifferBinary,  0x14, line(57600), true,  1,  254, OutputFormat::Hex,   ErrorBitLayout::MagMpg,   false, kGaugeRts},
    {DeviceModel::MPG500,  "MPG500",  CodecKind::PfeifferBinary,  0x04, line(57600), true,  1,  254, OutputFormat::Hex,   ErrorBitLayout::MagMpg,   false, kGaugeRts},
    {DeviceModel::BPG40x,  "BPG40x",  CodecKind::PfeifferBinary,  0x14, line(57600), true,  1,  254, OutputFormat::Hex,   ErrorBitLayout::Standard, false, kGaugeRts},
    {DeviceModel::BPG552,  "BPG552",  CodecKind::PfeifferBinary,  0x14, line(57600), true,  1,  254, OutputFormat::Hex,   ErrorBitLayout::Standard, false, kGaugeRts},
    {DeviceModel::BCG450,  "BCG450",  CodecKind::PfeifferBinary,  0x0B, line(57600), true,  1,  254, OutputFormat::Hex,   ErrorBitLayout::Standard, false, kGaugeRts},
    {DeviceModel::BCG552,  "BCG552",  CodecKind::PfeifferBinary,  0x02, line(57600), true,  1,  254, OutputFormat::Hex,   ErrorBitLayout::Standard, false, kGaugeRts},
    {DeviceModel::CDGxxxD, "CDGxxxD", CodecKind::Capacitance,     0x00, line(9600),  false, 0,  0,   OutputFormat::Hex,   ErrorBitLayout::None,     false, kGaugeRts},
    {DeviceModel::CDG025D, "CDG025D", CodecKind::Capacitance,     0x00, line(9600),  false, 0,  0,   OutputFormat::Hex,   ErrorBitLayout::None,     false, kGaugeRts},
    {DeviceModel::CDG045D, "CDG045D", CodecKind::Capacitance,     0x00, line(9600),  false, 0,  0,   OutputFormat::Hex,   ErrorBitLayout::None,     true,  kGaugeRts},
    {DeviceModel::CDG100D, "CDG100D", CodecKind::Capacitance,     0x00, line(9600),  false, 0,  0,   OutputFormat::Hex,   ErrorBitLayout::None,     false, kGaugeRts},
    {DeviceModel::CDG160D, "CDG160D", CodecKind::Capacitance,     0x00, line(9600),  false, 0,  0,   OutputFormat::Hex,   ErrorBitLayout::None,     false, kGaugeRts},
    {DeviceModel::CDG200D, "CDG200D", CodecKind::Capacitance,     0x00, line(9600),  false, 0,  0,   OutputFormat::Hex,   ErrorBitLayout::None,     false, kGaugeRts},
    {DeviceModel::PPG550,  "PPG550",  CodecKind::AsciiMnemonic,   0x00, line(9600),  true,  254, 254, OutputFormat::Ascii, ErrorBitLayout::None,     false, kGaugeRts},
    {DeviceModel::PPG570,  "PPG570",  CodecKind::AsciiMnemonic,   0x00, line(9600),  true,  254, 254, OutputFormat::Ascii, ErrorBitLayout::None,     false, kGaugeRts},
    {DeviceModel::TC600,   "TC600",   CodecKind::TurboAscii,      0x00, line(9600),  true,  1,  255, OutputFormat::Ascii, ErrorBitLayout::None,     false, kTurboRts},
};

constexpr std::size_t kModelCount = sizeof(kModels) / sizeof(kModels[0]);

std::string lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

const ModelInfo& model_info(DeviceModel model) {
    return kModels[static_cast<std::size_t>(model) % kModelCount];
}

const char* model_name(DeviceModel model) { return model_info(model).name; }

bool model_from_name(const std::string& name, DeviceModel& out) {
    const std::string n = lower(name);
    for (const auto& m : kModels) {
        if (lower(m.name) == n) { out = m.model; return true; }
    }
    return false;
}

const std::vector<DeviceModel>& all_models() {
    static const std::vector<DeviceModel> models = [] {
        std::vector<DeviceModel> v;
        for (const auto& m : kModels) v.push_back(m.model);
        return v;
    }();
    return models;
}

const std::vector<int>& standard_baud_rates() {
    static const std::vector<int> rates{115200, 57600, 38400, 19200, 9600};
    return rates;
}

std::vector<int> baud_candidates(DeviceModel model) {
    const int preferred = model_info(model).serial.baud;
    std::vector<int> out{preferred};
    for (int b : standard_baud_rates()) {
        if (b != preferred) out.push_back(b);
    }
    return out;
}

} // namespace gaugelink

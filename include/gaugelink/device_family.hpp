#pragma once
/**
 * @file device_family.hpp
 * @brief Fixed table of supported device models and their line parameters.
 *
 * @details
 * PURPOSE
 * -------
 * One immutable ModelInfo per supported model answers the questions a link
 * needs before it can talk to a device:
 *
 * - which codec speaks its wire format (CodecKind);
 * - the device id byte for the Pfeiffer binary family;
 * - serial framing (baud, byte size, parity, stop bits, timeouts);
 * - whether RS485 multidrop is available and the default address;
 * - the output format the raw frames are shown in by default;
 * - which error-status bit layout its firmware reports;
 * - whether it streams frames without being asked (CDG045D).
 *
 * Models by codec:
 *
 *   PfeifferBinary : PCG550 PSG550 MAG500 MPG500 BPG40x BPG552 BCG450 BCG552
 *   Capacitance    : CDGxxxD (generic, auto-detected) CDG025D CDG045D
 *                    CDG100D CDG160D CDG200D
 *   AsciiMnemonic  : PPG550 PPG570
 *   TurboAscii     : TC600
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "gaugelink/output_format.hpp"

namespace gaugelink {

enum class DeviceModel : uint8_t {
    PCG550 = 0, PSG550, MAG500, MPG500, BPG40x, BPG552, BCG450, BCG552,
    CDGxxxD, CDG025D, CDG045D, CDG100D, CDG160D, CDG200D,
    PPG550, PPG570,
    TC600
};

enum class CodecKind : uint8_t { PfeifferBinary = 0, Capacitance, AsciiMnemonic, TurboAscii };

enum class Parity : char { None = 'N', Even = 'E', Odd = 'O' };

enum class ElectricalMode : uint8_t { RS232 = 0, RS485 };

/// Which meaning the bits of the Pfeiffer error-status word (pid 228) carry.
enum class ErrorBitLayout : uint8_t { None = 0, Standard, MagMpg };

struct SerialParams {
    int baud{9600};
    int byte_size{8};
    Parity parity{Parity::None};
    int stop_bits{1};
    std::chrono::milliseconds timeout{1000};
    std::chrono::milliseconds write_timeout{1000};
};

/**
 * @brief RTS handling for half-duplex RS485 adapters that key the driver off RTS.
 *
 * send() drives RTS to @c tx_level and waits @c before_tx, writes and drains,
 * then drives RTS to @c rx_level and waits @c before_rx and @c settle.
 */
struct RtsTiming {
    bool tx_level{true};
    bool rx_level{false};
    std::chrono::milliseconds before_tx{2};
    std::chrono::milliseconds before_rx{2};
    std::chrono::milliseconds settle{0};
};

struct ModelInfo {
    DeviceModel model;
    const char* name;
    CodecKind codec;
    uint8_t device_id;            ///< Pfeiffer binary only; 0 elsewhere
    SerialParams serial;
    bool rs485_capable;
    int default_address;          ///< multidrop address used when RS485 is enabled
    int max_address;
    OutputFormat default_format;
    ErrorBitLayout error_layout;
    bool streams_continuously;
    RtsTiming rts;
};

const ModelInfo& model_info(DeviceModel model);
const char* model_name(DeviceModel model);

/// Case-insensitive lookup by name ("pcg550", "CDGxxxD", "tc600").
bool model_from_name(const std::string& name, DeviceModel& out);

const std::vector<DeviceModel>& all_models();

/// The generic capacitance placeholder that triggers model auto-detect.
inline bool is_generic_capacitance(DeviceModel m) { return m == DeviceModel::CDGxxxD; }

/// Baud rates tried during discovery, in descending order of preference.
const std::vector<int>& standard_baud_rates();

/**
 * @brief Candidate list for baud discovery: the model's default first, then the
 *        remaining standard rates from fastest to slowest.
 */
std::vector<int> baud_candidates(DeviceModel model);

} // namespace gaugelink

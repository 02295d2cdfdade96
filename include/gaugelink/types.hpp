#pragma once
/**
 * @file types.hpp
 * @brief Request/response value types shared by codecs, transports and the CLI.
 *
 * @details
 * PURPOSE
 * -------
 * Everything a caller hands to a link, and everything it gets back, lives here:
 *
 * - DeviceCommand: one Query or Set, created per action and consumed once.
 * - DeviceResponse: the only thing callers observe. Failures are data
 *   (success=false plus a specific message), never exceptions.
 * - ErrorKind: which class of failure produced a failed response.
 * - UnknownCommand / UnsupportedParamType: the two programmer errors that are
 *   allowed to unwind the stack.
 *
 * A Set command carries its value under the key "value" in @c parameters.
 */

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace gaugelink {

using Bytes = std::vector<uint8_t>;

/// A parameter value as supplied by a caller: bool, integer, real or text.
using ParamValue = std::variant<bool, long long, double, std::string>;

enum class CommandKind : uint8_t { Query = 0, Set = 1 };

/**
 * @brief One request for a device, addressed by catalog command name.
 */
struct DeviceCommand {
    std::string name;
    CommandKind kind{CommandKind::Query};
    std::map<std::string, ParamValue> parameters;

    static DeviceCommand query(const std::string& name) {
        DeviceCommand c;
        c.name = name;
        c.kind = CommandKind::Query;
        return c;
    }

    static DeviceCommand set(const std::string& name, ParamValue value) {
        DeviceCommand c;
        c.name = name;
        c.kind = CommandKind::Set;
        c.parameters["value"] = std::move(value);
        return c;
    }

    /// Set without a value (zero adjust, reset and other actions).
    static DeviceCommand action(const std::string& name) {
        DeviceCommand c;
        c.name = name;
        c.kind = CommandKind::Set;
        return c;
    }

    /// The "value" parameter, or nullptr when absent.
    const ParamValue* value() const {
        auto it = parameters.find("value");
        return it == parameters.end() ? nullptr : &it->second;
    }
};

enum class ErrorKind : uint8_t {
    None = 0,
    Connection,   ///< port open/close failure, or link not connected
    Timeout,      ///< no frame assembled before the deadline
    Framing,      ///< wrong device id, wrong length, checksum or CRC mismatch
    Device,       ///< device answered with a rejection (NAK, NO_DEF, _RANGE, _LOGIC)
    Encode,       ///< bad parameter value for the command
    Conversion,   ///< manual input that cannot be turned into bytes
    CallerError   ///< API misuse, e.g. send() while polling is active
};

const char* error_kind_name(ErrorKind kind);

/**
 * @brief Result of one exchange with a device.
 *
 * @c formatted is the decoded, human-readable reading. @c display is the raw
 * frame rendered in the link's current output format. @c values holds the
 * individual fields of a multi-value payload.
 */
struct DeviceResponse {
    Bytes raw;
    std::string formatted;
    bool success{false};
    std::string error;
    ErrorKind kind{ErrorKind::None};
    std::vector<std::string> values;
    std::string display;

    static DeviceResponse ok(Bytes raw, std::string text) {
        DeviceResponse r;
        r.raw = std::move(raw);
        r.formatted = std::move(text);
        r.success = true;
        return r;
    }

    static DeviceResponse fail(ErrorKind kind, std::string message, Bytes raw = {}) {
        DeviceResponse r;
        r.raw = std::move(raw);
        r.success = false;
        r.kind = kind;
        r.error = std::move(message);
        return r;
    }
};

/// Thrown when a command name is not in the codec's catalog.
class UnknownCommand : public std::out_of_range {
public:
    explicit UnknownCommand(const std::string& name)
    : std::out_of_range("unknown command: " + name), name_(name) {}
    const std::string& command() const noexcept { return name_; }
private:
    std::string name_;
};

/// Thrown when ParamCodec is asked for a type it does not implement.
class UnsupportedParamType : public std::invalid_argument {
public:
    explicit UnsupportedParamType(const std::string& what)
    : std::invalid_argument("unsupported param type: " + what) {}
};

// Value helpers used by codecs and the simulator. They do not throw; a value
// of the wrong kind (or unparsable text) returns false.
bool value_to_double(const ParamValue& v, double& out);
bool value_to_integer(const ParamValue& v, long long& out);
bool value_to_bool(const ParamValue& v, bool& out);
std::string value_to_string(const ParamValue& v);

} // namespace gaugelink

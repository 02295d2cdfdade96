#pragma once
/**
 * @file protocol_codec.hpp
 * @brief Family-independent interface for building request frames and decoding replies.
 *
 * @details
 * PURPOSE
 * -------
 * One ProtocolCodec is chosen when a link is opened (make_codec()) and is
 * used through this interface only; nothing downcasts it. A codec is fully
 * configured by its constructor (model, RS485 flag, multidrop address) and
 * never changes afterwards, so it may be shared freely between threads.
 *
 * REQUEST / REPLY PAIRING
 * -----------------------
 * Some wire formats (the 9-byte capacitance frame) do not say which
 * parameter they answer. encode() therefore returns a ResponseHint next to
 * the frame and the caller passes that hint back to decode(). The codec
 * keeps no "last command" of its own.
 *
 * ERRORS
 * ------
 * - Unknown command name: encode() throws UnknownCommand.
 * - Bad value, Set on a read-only command, Query on a write-only command:
 *   encode() returns false and fills @p err ("encode_error:...").
 * - Anything wrong with a reply: decode() returns a failed DeviceResponse.
 *
 * EXAMPLE
 * -------
 * @code
 *   auto codec = gaugelink::make_codec(gaugelink::DeviceModel::PCG550, false, 1);
 *   gaugelink::EncodedFrame f;
 *   std::string err;
 *   if (codec->encode(gaugelink::DeviceCommand::query("pressure"), f, err)) {
 *       // write f.bytes, read reply ...
 *       auto resp = codec->decode(reply, f.hint);
 *   }
 * @endcode
 */

#include <memory>
#include <string>
#include <vector>

#include "gaugelink/command_catalog.hpp"
#include "gaugelink/device_family.hpp"
#include "gaugelink/frame_reader.hpp"
#include "gaugelink/types.hpp"

namespace gaugelink {

/// What a reply is expected to answer. @c def is null for manual (raw) frames.
struct ResponseHint {
    std::string command;
    const CommandDefinition* def{nullptr};
    CommandKind kind{CommandKind::Query};

    bool empty() const { return def == nullptr; }
};

struct EncodedFrame {
    Bytes bytes;
    ResponseHint hint;
};

class ProtocolCodec {
public:
    virtual ~ProtocolCodec() = default;

    virtual CodecKind kind() const = 0;

    /// Build the request frame for @p cmd. Throws UnknownCommand.
    virtual bool encode(const DeviceCommand& cmd, EncodedFrame& out, std::string& err) const = 0;

    virtual DeviceResponse decode(const Bytes& raw, const ResponseHint& hint) const = 0;

    /// A few harmless reads used to test whether the link is alive.
    virtual std::vector<EncodedFrame> probe_frames() const = 0;

    /// How replies of this family end on the wire.
    virtual ReadSpec read_spec() const = 0;

    DeviceModel model() const { return model_; }
    bool rs485() const { return rs485_; }
    int address() const { return address_; }
    const CommandCatalog& catalog() const { return catalog_; }

protected:
    ProtocolCodec(DeviceModel model, bool rs485, int address)
    : model_(model), rs485_(rs485), address_(address), catalog_(catalog_for(model)) {}

    /**
     * @brief Catalog lookup plus the capability and value checks every family shares.
     *
     * Returns the definition (throws UnknownCommand when absent). When the
     * command cannot be sent as asked, returns nullptr and fills @p err.
     */
    const CommandDefinition* resolve(const DeviceCommand& cmd, std::string& err) const;

    /// Range check of the Set value against the definition; true when unbounded.
    static bool check_range(const CommandDefinition& def, const ParamValue& v, std::string& err);

    static ResponseHint hint_for(const DeviceCommand& cmd, const CommandDefinition& def) {
        return ResponseHint{cmd.name, &def, cmd.kind};
    }

private:
    DeviceModel model_;
    bool rs485_;
    int address_;
    const CommandCatalog& catalog_;
};

/**
 * @brief Create the codec for @p model.
 *
 * @p address is used only when @p rs485 is true; otherwise each family's
 * point-to-point default applies (0x00, 254, or the TC600 station address).
 */
std::unique_ptr<ProtocolCodec> make_codec(DeviceModel model, bool rs485, int address);

/// Shorthand used by probe_frames() implementations.
std::vector<EncodedFrame> encode_probes(const ProtocolCodec& codec, const std::vector<std::string>& names);

} // namespace gaugelink

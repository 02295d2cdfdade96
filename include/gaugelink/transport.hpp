#pragma once
/**
 * @file transport.hpp
 * @brief Serial-line DeviceLink: codec + frame reader + RS232/RS485 line handling.
 *
 * @details
 * PURPOSE
 * -------
 * Transport owns one serial port and one codec. A request goes through:
 *
 *   1. codec encode -> frame + ResponseHint
 *   2. discard stale input
 *   3. RS485 only: RTS to tx level, wait before_tx
 *   4. write and drain
 *   5. RS485 only: RTS to rx level, wait before_rx + settle
 *   6. read with the codec's strategy (fixed frame / terminator / idle)
 *   7. codec decode with the hint
 *
 * Any failure along the way becomes a failed DeviceResponse.
 *
 * ELECTRICAL MODE
 * ---------------
 * - RS232: DTR on, RTS on, never toggled.
 * - RS485: DTR on, RTS parked at the receive level between requests.
 * The RTS sleeps are short blocking waits and are not cancellation points.
 *
 * THREADING
 * ---------
 * All port access happens under one mutex. The poll worker takes it per
 * iteration, so stop_continuous() never has to interrupt a half-done
 * exchange.
 */

#include <memory>
#include <mutex>
#include <string>

#include "gaugelink/device_link.hpp"
#include "gaugelink/frame_reader.hpp"
#include "gaugelink/protocol_codec.hpp"
#include "gaugelink/transport/transport_base.hpp"

namespace gaugelink {

class Transport : public DeviceLink {
public:
    /// Real tty (LinuxSerialPort).
    explicit Transport(LinkConfig cfg);

    /// Any port implementation; used by tests with a scripted port.
    Transport(LinkConfig cfg, std::unique_ptr<transport::ISerialPort> port);

    ~Transport() override;

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    bool connect(std::string& err) override;
    void disconnect() override;
    bool is_connected() const override;

    DeviceResponse send(const DeviceCommand& cmd) override;
    DeviceResponse send_raw(const Bytes& frame) override;
    DeviceResponse receive() override;
    DeviceResponse probe() override;

    /**
     * @brief Find the line speed by probing each candidate rate.
     *
     * Tries the model default first, then the remaining standard rates from
     * fastest to slowest, reopening the port for each. On success the port
     * stays open at the working rate; otherwise it is reopened at the model
     * default and @p err says so.
     */
    bool discover_baud(std::string& err);

    /// Reopen with new line parameters. Refused while polling.
    bool reconfigure(const SerialParams& params, std::string& err);

    /// Switch RS232/RS485. Refused while polling or when the model has no RS485.
    bool set_electrical_mode(ElectricalMode mode, std::string& err);
    ElectricalMode electrical_mode() const;

    using DeviceLink::stop_continuous;
    bool start_continuous(std::chrono::milliseconds interval, ResponseSink sink, std::string& err) override;
    bool stop_continuous(std::chrono::milliseconds grace) override;
    bool polling() const override { return poller_.running(); }

    void set_output_format(OutputFormat f) override;
    OutputFormat output_format() const override;

    DeviceModel model() const override;
    const CommandCatalog& catalog() const override;

    SerialParams serial_params() const;

private:
    DeviceResponse send_locked(const DeviceCommand& cmd);
    DeviceResponse probe_locked();
    DeviceResponse receive_locked(const ResponseHint& hint);
    DeviceResponse exchange(const Bytes& frame, const ResponseHint& hint, bool raw);
    DeviceResponse read_reply(const ResponseHint& hint, bool raw);

    bool open_port(std::string& err);
    void apply_electrical_mode();
    void rebuild_codec();
    void auto_detect_model();

    static DeviceResponse busy_polling();

    LinkConfig cfg_;
    SerialParams serial_;
    RtsTiming rts_;
    ElectricalMode mode_;
    OutputFormat format_;

    std::unique_ptr<transport::ISerialPort> port_;
    std::unique_ptr<ProtocolCodec> codec_;
    bool connected_{false};

    mutable std::mutex io_;
    ContinuousPoller poller_;
};

} // namespace gaugelink

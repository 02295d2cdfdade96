#pragma once
/**
 * @file simulated_transport.hpp
 * @brief In-memory DeviceLink for running front-ends and tests without hardware.
 *
 * @details
 * PURPOSE
 * -------
 * SimulatedTransport answers the same calls as Transport from a small device
 * state record instead of a serial line. Command names, capability checks and
 * range checks go through the model's real codec, so a Set that the hardware
 * would refuse is refused here with the same message.
 *
 * BEHAVIOUR
 * ---------
 * - Queries return the stored value with uniform noise of +/- noise_fraction.
 * - Sets overwrite the stored value. Turbo speed must stay within
 *   1000..5000 rpm on top of the catalog range.
 * - Capacitance models answer with real 9-byte frames that go through
 *   CapacitanceCodec::decode(). The generic CDGxxxD identifies itself as a
 *   CDG025D on connect.
 * - Every reply waits response_delay first; error_probability makes a reply
 *   fail at random. The generator is seeded, so runs repeat.
 * - send_raw() is a loopback: the frame comes back as the reply.
 */

#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>

#include "gaugelink/device_link.hpp"
#include "gaugelink/protocol_codec.hpp"

namespace gaugelink {

struct SimulatedState {
    double pressure{1.0e-3};      ///< mbar; fraction of full scale on capacitance gauges
    double temperature{25.0};     ///< C
    long long speed{1500};        ///< rpm
    bool motor_on{false};
    std::map<std::string, std::string> values;   ///< every other written value, by command name
};

class SimulatedTransport : public DeviceLink {
public:
    static constexpr long long kMinSpeed = 1000;
    static constexpr long long kMaxSpeed = 5000;

    explicit SimulatedTransport(LinkConfig cfg);
    ~SimulatedTransport() override;

    SimulatedTransport(const SimulatedTransport&) = delete;
    SimulatedTransport& operator=(const SimulatedTransport&) = delete;

    bool connect(std::string& err) override;
    void disconnect() override;
    bool is_connected() const override;

    DeviceResponse send(const DeviceCommand& cmd) override;
    DeviceResponse send_raw(const Bytes& frame) override;
    DeviceResponse receive() override;
    DeviceResponse probe() override;

    using DeviceLink::stop_continuous;
    bool start_continuous(std::chrono::milliseconds interval, ResponseSink sink, std::string& err) override;
    bool stop_continuous(std::chrono::milliseconds grace) override;
    bool polling() const override { return poller_.running(); }

    void set_output_format(OutputFormat f) override;
    OutputFormat output_format() const override;

    DeviceModel model() const override;
    const CommandCatalog& catalog() const override;

    /// Snapshot of the device state (tests).
    SimulatedState state() const;

private:
    DeviceResponse send_locked(const DeviceCommand& cmd);
    DeviceResponse reply_query(const CommandDefinition& def);
    DeviceResponse reply_set(const DeviceCommand& cmd, const CommandDefinition& def);
    DeviceResponse capacitance_reply(const EncodedFrame& f, const DeviceCommand& cmd);
    DeviceResponse finish(DeviceResponse r) const;

    double noisy(double v);
    bool roll_error();
    void identify_capacitance();

    LinkConfig cfg_;
    SimulatorOptions opts_;
    OutputFormat format_;
    std::unique_ptr<ProtocolCodec> codec_;
    SimulatedState state_;
    bool connected_{false};

    std::mt19937 rng_;
    mutable std::mutex io_;
    ContinuousPoller poller_;
};

} // namespace gaugelink

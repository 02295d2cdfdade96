#pragma once
/**
 * @file device_link.hpp
 * @brief The consumer-facing API: one open connection to one device.
 *
 * @details
 * PURPOSE
 * -------
 * Front-ends (the CLI here, a GUI elsewhere) talk to a DeviceLink and never
 * see whether it is a real serial line (Transport) or the in-memory
 * simulator (SimulatedTransport).
 *
 * RULES
 * -----
 * - DeviceResponse::success is the only error signal. No I/O or protocol
 *   problem throws; UnknownCommand is the exception (a programmer error).
 * - One caller at a time. While continuous polling is active the poll loop
 *   owns the link and send()/send_raw()/probe() fail with
 *   ErrorKind::CallerError.
 * - stop_continuous() returns only after the loop has exited, so the link
 *   can be reconfigured straight afterwards.
 *
 * EXAMPLE
 * -------
 * @code
 *   gaugelink::LinkConfig cfg;
 *   cfg.port = "/dev/ttyUSB0";
 *   cfg.model = gaugelink::DeviceModel::TC600;
 *   std::string err;
 *   auto link = gaugelink::open_link(cfg, err);
 *   if (!link) { std::cerr << "status=error reason=" << err << "\n"; return 3; }
 *   auto r = link->send(gaugelink::DeviceCommand::query("get_speed"));
 * @endcode
 */

#include <chrono>
#include <memory>
#include <string>

#include "gaugelink/command_catalog.hpp"
#include "gaugelink/config.hpp"
#include "gaugelink/continuous_poller.hpp"
#include "gaugelink/output_format.hpp"
#include "gaugelink/types.hpp"

namespace gaugelink {

class DeviceLink {
public:
    static constexpr std::chrono::milliseconds kDefaultStopGrace{2000};

    virtual ~DeviceLink() = default;

    virtual bool connect(std::string& err) = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    virtual DeviceResponse send(const DeviceCommand& cmd) = 0;

    /// Manual bytes; the reply is rendered in the current output format.
    virtual DeviceResponse send_raw(const Bytes& frame) = 0;

    /// One unsolicited frame (streaming devices).
    virtual DeviceResponse receive() = 0;

    /// First successful probe reply, or the last failure.
    virtual DeviceResponse probe() = 0;

    virtual bool start_continuous(std::chrono::milliseconds interval, ResponseSink sink, std::string& err) = 0;
    virtual bool stop_continuous(std::chrono::milliseconds grace) = 0;
    bool stop_continuous() { return stop_continuous(kDefaultStopGrace); }
    virtual bool polling() const = 0;

    virtual void set_output_format(OutputFormat f) = 0;
    virtual OutputFormat output_format() const = 0;

    /// Current model; changes once when a generic capacitance gauge is identified.
    virtual DeviceModel model() const = 0;
    virtual const CommandCatalog& catalog() const = 0;
};

/**
 * @brief Build and connect the link described by @p cfg.
 *
 * Runs baud discovery when cfg.auto_baud is set. Returns nullptr and fills
 * @p err when the configuration is invalid or the port cannot be opened.
 */
std::unique_ptr<DeviceLink> open_link(const LinkConfig& cfg, std::string& err);

} // namespace gaugelink

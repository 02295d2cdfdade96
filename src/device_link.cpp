// ============================================================================
// device_link.cpp - open_link(): configuration to connected DeviceLink
// ============================================================================

#include "gaugelink/device_link.hpp"
#include "gaugelink/log.hpp"
#include "gaugelink/simulated_transport.hpp"
#include "gaugelink/transport.hpp"

namespace gaugelink {

std::unique_ptr<DeviceLink> open_link(const LinkConfig& cfg, std::string& err) {
    if (!validate_config(cfg, err)) return nullptr;

    if (cfg.simulator.enabled) {
        auto sim = std::make_unique<SimulatedTransport>(cfg);
        if (!sim->connect(err)) return nullptr;
        return sim;
    }

    auto link = std::make_unique<Transport>(cfg);
    if (!link->connect(err)) return nullptr;

    if (cfg.auto_baud) {
        std::string baud_err;
        if (!link->discover_baud(baud_err)) {
            // Link stays open at the model default rate.
            log::warn("baud_discovery_failed", {{"port", cfg.port}, {"reason", baud_err}});
        }
    }
    return link;
}

} // namespace gaugelink

#include <doctest/doctest.h>
#include "gaugelink/simulated_transport.hpp"

#include <atomic>
#include <thread>

using namespace gaugelink;
using namespace std::chrono_literals;

static LinkConfig sim_config(DeviceModel model) {
    LinkConfig cfg;
    cfg.model = model;
    cfg.simulator.enabled = true;
    cfg.simulator.noise_fraction = 0.0;
    return cfg;
}

static std::unique_ptr<SimulatedTransport> connected(const LinkConfig& cfg) {
    auto sim = std::make_unique<SimulatedTransport>(cfg);
    std::string err;
    REQUIRE(sim->connect(err));
    return sim;
}

TEST_CASE("Simulated gauges answer queries through the model catalog") {
    auto sim = connected(sim_config(DeviceModel::PCG550));

    auto p = sim->send(DeviceCommand::query("pressure"));
    REQUIRE(p.success);
    CHECK(p.formatted == "Pressure: 1.00E-03 mbar");

    auto t = sim->send(DeviceCommand::query("temperature"));
    CHECK(t.formatted == "Temperature: 25.0 C");

    auto sn = sim->send(DeviceCommand::query("serial_number"));
    CHECK(sn.formatted == "SIM-PCG550");

    CHECK_THROWS_AS(sim->send(DeviceCommand::query("get_speed")), UnknownCommand);
    CHECK(sim->send(DeviceCommand::set("pressure", 1.0)).kind == ErrorKind::Encode);
}

TEST_CASE("Turbo speed is a percentage of 5000 rpm within 1000..5000") {
    auto sim = connected(sim_config(DeviceModel::TC600));

    CHECK(sim->send(DeviceCommand::query("get_speed")).formatted == "0 rpm");

    auto set = sim->send(DeviceCommand::set("set_speed", 50LL));
    REQUIRE(set.success);
    CHECK(set.formatted == "Speed set to 2500 rpm");
    CHECK(sim->state().speed == 2500);

    auto low = sim->send(DeviceCommand::set("set_speed", 10LL));
    CHECK(low.kind == ErrorKind::Device);
    CHECK(low.error == "out_of_range(1000..5000 rpm)");

    auto over = sim->send(DeviceCommand::set("set_speed", 150LL));
    CHECK(over.kind == ErrorKind::Encode);
    CHECK(over.error == "encode_error:out_of_range(0..100)");

    CHECK(sim->send(DeviceCommand::set("motor_on", true)).formatted == "Motor set to On");
    CHECK(sim->state().motor_on);
    CHECK(sim->send(DeviceCommand::query("get_speed")).formatted == "2500 rpm");
}

TEST_CASE("The generic capacitance gauge identifies itself on connect") {
    auto sim = connected(sim_config(DeviceModel::CDGxxxD));
    CHECK(sim->model() == DeviceModel::CDG025D);

    auto p = sim->send(DeviceCommand::query("pressure"));
    REQUIRE(p.success);
    CHECK(p.formatted == "Pressure: 7.50E-01 mbar, status: temp_ok");
    REQUIRE(p.raw.size() == 9);
    CHECK(p.raw[0] == 0x07);

    REQUIRE(sim->send(DeviceCommand::set("unit", 1LL)).success);
    CHECK(sim->send(DeviceCommand::query("pressure")).formatted == "Pressure: 7.50E-01 Torr, status: temp_ok");
}

TEST_CASE("Error probability 1 fails every reply") {
    auto cfg = sim_config(DeviceModel::PPG550);
    cfg.simulator.error_probability = 1.0;
    auto sim = connected(cfg);

    auto r = sim->send(DeviceCommand::query("pressure"));
    CHECK(r.kind == ErrorKind::Connection);
    CHECK(r.error == "simulated error: ERR_DISCONNECTED");
}

TEST_CASE("Noise stays within the configured fraction") {
    auto cfg = sim_config(DeviceModel::PCG550);
    cfg.simulator.noise_fraction = 0.1;
    auto sim = connected(cfg);

    for (int i = 0; i < 20; ++i) {
        auto r = sim->send(DeviceCommand::query("pressure"));
        REQUIRE(r.success);
        REQUIRE_FALSE(r.values.empty());
        const double v = std::stod(r.values.front());
        CHECK(v >= 0.9e-3 * 0.99);
        CHECK(v <= 1.1e-3 * 1.01);
    }
}

TEST_CASE("Raw frames are looped back") {
    auto sim = connected(sim_config(DeviceModel::PCG550));
    auto r = sim->send_raw(Bytes{0x01, 0xAB});
    REQUIRE(r.success);
    CHECK(r.raw == Bytes{0x01, 0xAB});
    CHECK(r.formatted == "01 ab");
    CHECK(sim->send_raw(Bytes{}).kind == ErrorKind::Conversion);
}

TEST_CASE("Probe answers with the first probe command") {
    auto sim = connected(sim_config(DeviceModel::TC600));
    auto r = sim->probe();
    REQUIRE(r.success);
    CHECK(r.formatted == "0 rpm");
}

TEST_CASE("Simulated polling delivers until stopped") {
    auto sim = connected(sim_config(DeviceModel::PCG550));
    std::atomic<int> count{0};
    std::string err;
    REQUIRE(sim->start_continuous(5ms, [&](const DeviceResponse& r) {
        if (r.success) ++count;
    }, err));

    CHECK(sim->send(DeviceCommand::query("pressure")).kind == ErrorKind::CallerError);
    std::this_thread::sleep_for(60ms);
    CHECK(sim->stop_continuous(500ms));

    const int after_stop = count.load();
    CHECK(after_stop > 0);
    std::this_thread::sleep_for(30ms);
    CHECK(count.load() == after_stop);
}

TEST_CASE("open_link picks the simulator and validates first") {
    std::string err;
    auto link = open_link(sim_config(DeviceModel::MAG500), err);
    REQUIRE(link);
    CHECK(link->is_connected());
    CHECK(link->model() == DeviceModel::MAG500);

    LinkConfig bad;
    CHECK_FALSE(open_link(bad, err));
    CHECK(err == "bad_value:port");

    auto rs485 = sim_config(DeviceModel::CDG025D);
    rs485.rs485 = true;
    CHECK_FALSE(open_link(rs485, err));
    CHECK(err == "bad_value:rs485");
}

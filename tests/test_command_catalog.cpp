#include <doctest/doctest.h>
#include "gaugelink/command_catalog.hpp"
#include "gaugelink/device_family.hpp"
#include "gaugelink/protocol_codec.hpp"

using namespace gaugelink;

TEST_CASE("Every model has a catalog with a continuous command and answerable probes") {
    for (DeviceModel m : all_models()) {
        CAPTURE(model_name(m));
        const CommandCatalog& cat = catalog_for(m);
        CHECK(cat.size() > 0);

        const CommandDefinition* cont = cat.continuous_command();
        REQUIRE(cont != nullptr);
        CHECK(cont->readable);

        auto codec = make_codec(m, false, model_info(m).default_address);
        CHECK_FALSE(codec->probe_frames().empty());
    }
}

TEST_CASE("Catalog lookup by name") {
    const CommandCatalog& tc = catalog_for(DeviceModel::TC600);
    const CommandDefinition& speed = tc.at("set_speed");
    CHECK(speed.pid == 308);
    CHECK(speed.writable);
    CHECK(speed.range_text() == "(0..100)");
    CHECK(speed.in_range(50.0));
    CHECK_FALSE(speed.in_range(101.0));

    CHECK(tc.find("no_such_command") == nullptr);
    CHECK_THROWS_AS(tc.at("no_such_command"), UnknownCommand);
}

TEST_CASE("Mnemonic catalogs expose the mnemonic as wire id") {
    const CommandDefinition& p = catalog_for(DeviceModel::PPG550).at("pressure");
    CHECK(p.wire_id() == "PR3");
    CHECK(catalog_for(DeviceModel::PPG550).find("atm_pressure") == nullptr);
    CHECK(catalog_for(DeviceModel::PPG570).at("atm_pressure").wire_id() == "PR4");
}

TEST_CASE("Catalogs are shared per family") {
    CHECK(&catalog_for(DeviceModel::CDG025D) == &catalog_for(DeviceModel::CDG200D));
    CHECK(&catalog_for(DeviceModel::PCG550) != &catalog_for(DeviceModel::MAG500));
}

TEST_CASE("Model names resolve case-insensitively") {
    DeviceModel m{};
    REQUIRE(model_from_name("tc600", m));
    CHECK(m == DeviceModel::TC600);
    REQUIRE(model_from_name("CDGxxxD", m));
    CHECK(is_generic_capacitance(m));
    CHECK_FALSE(model_from_name("XYZ123", m));
}

TEST_CASE("Line parameters per family") {
    CHECK(model_info(DeviceModel::PCG550).serial.baud == 57600);
    CHECK(model_info(DeviceModel::PCG550).device_id == 0x02);
    CHECK(model_info(DeviceModel::BPG40x).device_id == 0x14);
    CHECK(model_info(DeviceModel::BPG40x).codec == CodecKind::PfeifferBinary);
    CHECK(model_info(DeviceModel::CDG045D).serial.baud == 9600);
    CHECK(model_info(DeviceModel::CDG045D).streams_continuously);
    CHECK_FALSE(model_info(DeviceModel::CDG045D).rs485_capable);
    CHECK(model_info(DeviceModel::TC600).max_address == 255);
    CHECK(model_info(DeviceModel::TC600).rts.before_tx.count() == 5);
}

TEST_CASE("Baud discovery tries the family default first") {
    const auto pcg = baud_candidates(DeviceModel::PCG550);
    REQUIRE(pcg.size() == standard_baud_rates().size());
    CHECK(pcg.front() == 57600);
    CHECK(pcg == std::vector<int>{57600, 115200, 38400, 19200, 9600});

    const auto tc = baud_candidates(DeviceModel::TC600);
    CHECK(tc == std::vector<int>{9600, 115200, 57600, 38400, 19200});
}

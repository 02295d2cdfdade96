#include <doctest/doctest.h>
#include "gaugelink/checksum.hpp"
#include "gaugelink/codecs/capacitance_codec.hpp"

using namespace gaugelink;
using gaugelink::codecs::CapacitanceCodec;

static Bytes reply(uint8_t status, uint8_t p_hi, uint8_t p_lo, uint8_t read_value = 0) {
    Bytes f{0x07, 0x00, status, 0x00, p_hi, p_lo, read_value, 0x00};
    f.push_back(additive_checksum(f.data() + 1, 7));
    return f;
}

static ResponseHint hint(const ProtocolCodec& codec, const std::string& name) {
    return ResponseHint{name, codec.catalog().find(name), CommandKind::Query};
}

TEST_CASE("Request frame checksum covers service, address and data") {
    const Bytes f = CapacitanceCodec::request(0x00, 0x10, 0x00);
    CHECK(f == Bytes{0x03, 0x00, 0x10, 0x00, 0x10});
}

TEST_CASE("Catalog commands pick the service byte") {
    CapacitanceCodec codec(DeviceModel::CDG025D);
    EncodedFrame f;
    std::string err;

    REQUIRE(codec.encode(DeviceCommand::query("software_version"), f, err));
    CHECK(f.bytes == Bytes{0x03, 0x00, 0x10, 0x00, 0x10});

    REQUIRE(codec.encode(DeviceCommand::set("unit", 1LL), f, err));
    CHECK(f.bytes == Bytes{0x03, 0x10, 0x01, 0x01, 0x12});

    REQUIRE(codec.encode(DeviceCommand::action("zero_adjust"), f, err));
    CHECK(f.bytes[1] == 0x40);

    CHECK_FALSE(codec.encode(DeviceCommand::set("unit", 3LL), f, err));
    CHECK(err == "encode_error:out_of_range(0..2)");
}

TEST_CASE("Pressure is signed 16-bit with 14 fractional bits") {
    CHECK(CapacitanceCodec::pressure_from(0x40, 0x00) == doctest::Approx(1.0));
    CHECK(CapacitanceCodec::pressure_from(0xC0, 0x00) == doctest::Approx(-1.0));
    CHECK(CapacitanceCodec::pressure_from(0x20, 0x00) == doctest::Approx(0.5));

    CapacitanceCodec codec(DeviceModel::CDG045D);
    const Bytes raw = reply(0x80, 0x40, 0x00);
    CHECK(raw[8] == ((0x00 + 0x80 + 0x00 + 0x40 + 0x00 + 0x00 + 0x00) & 0xFF));

    auto r = codec.decode(raw, hint(codec, "pressure"));
    REQUIRE(r.success);
    CHECK(r.formatted == "Pressure: 1.00E+00 mbar, status: heating");
    CHECK(r.values == std::vector<std::string>{"1.00E+00", "mbar"});
}

TEST_CASE("Status bits") {
    auto s = CapacitanceCodec::status_from(0x40 | 0x10);
    CHECK_FALSE(s.heating);
    CHECK(s.temperature_ok);
    CHECK(std::string(s.unit) == "Torr");
}

TEST_CASE("The hint decides what the reply means") {
    CapacitanceCodec codec(DeviceModel::CDG025D);
    const Bytes raw = reply(0x40, 0x10, 0x00, 2);

    CHECK(codec.decode(raw, hint(codec, "temperature")).formatted == "Temperature OK");
    CHECK(codec.decode(reply(0x00, 0, 0), hint(codec, "temperature")).formatted == "Temperature not ready");
    CHECK(codec.decode(raw, hint(codec, "cdg_type")).formatted == "CDG type: CDG100D");
    CHECK(codec.decode(raw, ResponseHint{}).formatted.rfind("Response: 07 00 40", 0) == 0);
}

TEST_CASE("Malformed replies are framing errors") {
    CapacitanceCodec codec(DeviceModel::CDG025D);
    Bytes raw = reply(0x40, 0x10, 0x00);

    Bytes bad_sum = raw;
    bad_sum[8] ^= 0xFF;
    CHECK(codec.decode(bad_sum, {}).error == "checksum mismatch");

    Bytes bad_sync = raw;
    bad_sync[0] = 0x06;
    CHECK(codec.decode(bad_sync, {}).error == "invalid start byte");

    raw.pop_back();
    CHECK(codec.decode(raw, {}).error == "invalid response length");
}

TEST_CASE("Type codes 0 to 4 map onto the concrete gauges") {
    const DeviceModel expected[] = {DeviceModel::CDG025D, DeviceModel::CDG045D, DeviceModel::CDG100D,
                                    DeviceModel::CDG160D, DeviceModel::CDG200D};
    for (uint8_t code = 0; code < 5; ++code) {
        DeviceModel m{};
        REQUIRE(CapacitanceCodec::detect_model(reply(0x40, 0, 0, code), m));
        CHECK(m == expected[code]);
    }
    DeviceModel m{};
    CHECK_FALSE(CapacitanceCodec::detect_model(reply(0x40, 0, 0, 5), m));
}

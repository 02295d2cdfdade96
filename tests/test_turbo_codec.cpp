#include <doctest/doctest.h>
#include "gaugelink/checksum.hpp"
#include "gaugelink/codecs/turbo_ascii_codec.hpp"

using namespace gaugelink;
using gaugelink::codecs::TurboAsciiCodec;

static std::string text_of(const Bytes& b) { return std::string(b.begin(), b.end()); }
static Bytes wire(const std::string& s) { return Bytes(s.begin(), s.end()); }

static ResponseHint hint(const TurboAsciiCodec& codec, const std::string& name) {
    return ResponseHint{name, codec.catalog().find(name), CommandKind::Query};
}

TEST_CASE("Telegrams end in a three digit additive checksum and CR") {
    CHECK(TurboAsciiCodec::seal("0010030902=?") == "0010030902=?107\r");
    CHECK(additive_checksum(std::string("0010030902=?")) == 107);
}

TEST_CASE("Reads ask with =? and writes carry a six character field") {
    TurboAsciiCodec codec(DeviceModel::TC600, false, 1);
    EncodedFrame f;
    std::string err;

    REQUIRE(codec.encode(DeviceCommand::query("get_speed"), f, err));
    CHECK(text_of(f.bytes) == "0010030902=?107\r");

    REQUIRE(codec.encode(DeviceCommand::set("set_speed", 50LL), f, err));
    CHECK(text_of(f.bytes) == "0011030806000050024\r");
    CHECK(text_of(f.bytes).find("000050") != std::string::npos);

    CHECK_FALSE(codec.encode(DeviceCommand::set("set_speed", 101LL), f, err));
    CHECK(err == "encode_error:out_of_range(0..100)");
}

TEST_CASE("Setpoints typed as text are decimal even with leading zeros") {
    TurboAsciiCodec codec(DeviceModel::TC600, false, 1);
    EncodedFrame f;
    std::string err;

    REQUIRE(codec.encode(DeviceCommand::set("set_speed", std::string("050")), f, err));
    CHECK(text_of(f.bytes) == "0011030806000050024\r");

    CHECK_FALSE(codec.encode(DeviceCommand::set("set_speed", std::string("0101")), f, err));
    CHECK(err == "encode_error:out_of_range(0..100)");
}

TEST_CASE("Station address is used on RS232 too") {
    TurboAsciiCodec codec(DeviceModel::TC600, false, 42);
    EncodedFrame f;
    std::string err;
    REQUIRE(codec.encode(DeviceCommand::query("get_speed"), f, err));
    CHECK(text_of(f.bytes).rfind("042", 0) == 0);
}

TEST_CASE("Data fields decode with the type of the requested parameter") {
    TurboAsciiCodec codec(DeviceModel::TC600, false, 1);

    auto speed = codec.decode(wire("0011030906001500026\r"), hint(codec, "get_speed"));
    REQUIRE(speed.success);
    CHECK(speed.formatted == "1500 rpm");
    CHECK(speed.values == std::vector<std::string>{"1500"});

    auto motor = codec.decode(wire("0011002306111111019\r"), hint(codec, "motor_on"));
    REQUIRE(motor.success);
    CHECK(motor.formatted == "On");

    auto unhinted = codec.decode(wire("0011030906001500026\r"), {});
    REQUIRE(unhinted.success);
    CHECK(unhinted.formatted == "1500 rpm");
}

TEST_CASE("Rejection markers are device errors") {
    TurboAsciiCodec codec(DeviceModel::TC600, false, 1);
    CHECK(codec.decode(wire("0011030806_RANGE191\r"), {}).error == "value out of range");

    auto no_def = codec.decode(wire("0011099906NO_DEF000\r"), {});
    CHECK(no_def.kind == ErrorKind::Device);
    CHECK(no_def.error == "parameter does not exist");

    CHECK(codec.decode(wire("0011030806_LOGIC000\r"), {}).error == "command logic error");
}

TEST_CASE("Malformed telegrams are framing errors") {
    TurboAsciiCodec codec(DeviceModel::TC600, false, 1);

    auto short_reply = codec.decode(wire("00110\r"), {});
    CHECK(short_reply.kind == ErrorKind::Framing);
    CHECK(short_reply.error == "response too short");

    CHECK(codec.decode(wire("0011030906001500027\r"), {}).error == "checksum mismatch");

    auto wrong_pid = codec.decode(wire("0011030906001500026\r"), hint(codec, "set_speed"));
    CHECK_FALSE(wrong_pid.success);
    CHECK(wrong_pid.error == "unexpected parameter 309 (expected 308)");

    CHECK(codec.decode(Bytes{}, {}).kind == ErrorKind::Timeout);
}

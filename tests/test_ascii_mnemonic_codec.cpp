#include <doctest/doctest.h>
#include "gaugelink/codecs/ascii_mnemonic_codec.hpp"

using namespace gaugelink;
using gaugelink::codecs::AsciiMnemonicCodec;

static std::string text_of(const Bytes& b) { return std::string(b.begin(), b.end()); }
static Bytes wire(const std::string& s) { return Bytes(s.begin(), s.end()); }

TEST_CASE("RS232 requests go to the broadcast address") {
    AsciiMnemonicCodec codec(DeviceModel::PPG550, false, 1);
    EncodedFrame f;
    std::string err;
    REQUIRE(codec.encode(DeviceCommand::query("pressure"), f, err));
    CHECK(text_of(f.bytes) == "@254PR3?\\");
    CHECK(f.hint.command == "pressure");
}

TEST_CASE("RS485 requests carry the zero-padded address") {
    AsciiMnemonicCodec codec(DeviceModel::PPG570, true, 7);
    EncodedFrame f;
    std::string err;
    REQUIRE(codec.encode(DeviceCommand::query("atm_pressure"), f, err));
    CHECK(text_of(f.bytes) == "@007PR4?\\");

    REQUIRE(codec.encode(DeviceCommand::set("unit", std::string("TORR")), f, err));
    CHECK(text_of(f.bytes) == "@007U!TORR\\");
}

TEST_CASE("Values containing the terminator are refused") {
    AsciiMnemonicCodec codec(DeviceModel::PPG550, false, 1);
    EncodedFrame f;
    std::string err;
    CHECK_FALSE(codec.encode(DeviceCommand::set("unit", std::string("A\\B")), f, err));
    CHECK(err == "encode_error:terminator_in_value");
}

TEST_CASE("PR4 exists on the PPG570 only") {
    AsciiMnemonicCodec codec(DeviceModel::PPG550, false, 1);
    EncodedFrame f;
    std::string err;
    CHECK_THROWS_AS(codec.encode(DeviceCommand::query("atm_pressure"), f, err), UnknownCommand);
}

TEST_CASE("ACK replies split on commas") {
    AsciiMnemonicCodec codec(DeviceModel::PPG550, false, 1);

    auto one = codec.decode(wire("@254ACK7.50E+2\\"), {});
    REQUIRE(one.success);
    CHECK(one.formatted == "7.50E+2");

    auto two = codec.decode(wire("@ACK1.0E-3,2.0E-3;FF\\"), {});
    REQUIRE(two.success);
    CHECK(two.values == std::vector<std::string>{"1.0E-3", "2.0E-3"});
    CHECK(two.formatted == "1.0E-3, 2.0E-3");
}

TEST_CASE("NAK replies are device errors with the reported reason") {
    AsciiMnemonicCodec codec(DeviceModel::PPG550, false, 1);

    auto r = codec.decode(wire("@254NAK BAD;FF\\"), {});
    CHECK_FALSE(r.success);
    CHECK(r.kind == ErrorKind::Device);
    CHECK(r.error == "BAD");

    auto empty = codec.decode(wire("@NAK\\"), {});
    CHECK(empty.error == "unknown error");
}

TEST_CASE("Anything else is a framing error") {
    AsciiMnemonicCodec codec(DeviceModel::PPG550, false, 1);
    CHECK(codec.decode(wire("254ACK1\\"), {}).error == "invalid response format");
    CHECK(codec.decode(wire("@254XYZ\\"), {}).error == "invalid response format");
    CHECK(codec.decode(Bytes{'@', 0xFF}, {}).kind == ErrorKind::Framing);
    CHECK(codec.decode(Bytes{}, {}).kind == ErrorKind::Timeout);
}

TEST_CASE("Replies are read up to the backslash, NAK tails included") {
    AsciiMnemonicCodec codec(DeviceModel::PPG550, false, 1);
    const ReadSpec s = codec.read_spec();
    CHECK(s.strategy == ReadStrategy::Terminator);
    CHECK(s.terminator == std::string("\\"));
    CHECK(s.nak_marker == std::string("@NAK"));
    CHECK(s.marker_address_digits == 3);
}

#include <doctest/doctest.h>
#include "fake_serial_port.hpp"
#include "gaugelink/frame_reader.hpp"
#include "gaugelink/codecs/ascii_mnemonic_codec.hpp"

using namespace gaugelink;
using gaugelink::testing::FakeSerialPort;
using gaugelink::testing::bytes_of;
using namespace std::chrono_literals;

static std::string text_of(const Bytes& b) { return std::string(b.begin(), b.end()); }

TEST_CASE("Fixed frames skip garbage before the sync byte") {
    FakeSerialPort port;
    port.feed(Bytes{0x55, 0xAA, 0x07, 1, 2, 3, 4, 5, 6, 7, 8, 0x99});
    FrameReader reader(port);

    auto r = reader.read_fixed_frame(0x07, 9, 200ms);
    REQUIRE(r.status == ReadStatus::Complete);
    CHECK(r.bytes == Bytes{0x07, 1, 2, 3, 4, 5, 6, 7, 8});
}

TEST_CASE("A short fixed frame times out without bytes") {
    FakeSerialPort port;
    port.feed(Bytes{0x07, 1, 2});
    FrameReader reader(port);

    const auto t0 = std::chrono::steady_clock::now();
    auto r = reader.read_fixed_frame(0x07, 9, 50ms);
    CHECK(r.status == ReadStatus::Timeout);
    CHECK_FALSE(r.received());
    CHECK(std::chrono::steady_clock::now() - t0 < 500ms);
}

TEST_CASE("Terminated frames complete on the terminator") {
    FakeSerialPort port;
    port.feed(bytes_of("@ACK7.5E+2\\trailing"));
    FrameReader reader(port);

    auto r = reader.read_until_terminator("\\", 200ms);
    REQUIRE(r.status == ReadStatus::Complete);
    CHECK(text_of(r.bytes) == "@ACK7.5E+2\\");
}

TEST_CASE("A reply without terminator comes back as partial once the line idles") {
    FakeSerialPort port;
    port.feed(bytes_of("@ACK1"));
    port.feed(bytes_of("\\"), 150ms);
    FrameReader reader(port, 20ms);

    auto r = reader.read_until_terminator("\\", 1000ms);
    CHECK(r.status == ReadStatus::Partial);
    CHECK(text_of(r.bytes) == "@ACK1");
}

TEST_CASE("A NAK reply is not cut at the idle gap") {
    FakeSerialPort port;
    port.feed(bytes_of("@NAK"));
    port.feed(bytes_of("160\\"), 80ms);
    FrameReader reader(port, 20ms);

    auto r = reader.read_until_terminator("\\", 1000ms, "@NAK", "\\");
    REQUIRE(r.status == ReadStatus::Complete);
    CHECK(text_of(r.bytes) == "@NAK160\\");
}

TEST_CASE("An addressed NAK keeps its reason across a pause") {
    FakeSerialPort port;
    port.feed(bytes_of("@254NAK"));
    port.feed(bytes_of("160\\"), 80ms);
    FrameReader reader(port, 20ms);
    codecs::AsciiMnemonicCodec codec(DeviceModel::PPG550, true, 254);

    auto r = reader.read(codec.read_spec(), 1000ms);
    REQUIRE(r.status == ReadStatus::Complete);
    CHECK(text_of(r.bytes) == "@254NAK160\\");

    auto resp = codec.decode(r.bytes, {});
    CHECK(resp.kind == ErrorKind::Device);
    CHECK(resp.error == "160");
}

TEST_CASE("An addressed ACK is still cut at the idle gap") {
    FakeSerialPort port;
    port.feed(bytes_of("@254ACK1"));
    port.feed(bytes_of("\\"), 150ms);
    FrameReader reader(port, 20ms);

    auto r = reader.read_until_terminator("\\", 1000ms, "@NAK", "\\", 3);
    CHECK(r.status == ReadStatus::Partial);
    CHECK(text_of(r.bytes) == "@254ACK1");
}

TEST_CASE("Idle reads end at the first quiet gap") {
    FakeSerialPort port;
    port.feed(Bytes{0x02, 0x00, 0xDD});
    port.feed(Bytes{0xEE}, 150ms);
    FrameReader reader(port, 20ms);

    auto r = reader.read_until_idle(1000ms);
    REQUIRE(r.status == ReadStatus::Complete);
    CHECK(r.bytes == Bytes{0x02, 0x00, 0xDD});
}

TEST_CASE("Every strategy returns on a silent line") {
    FakeSerialPort port;
    FrameReader reader(port);

    const auto t0 = std::chrono::steady_clock::now();
    CHECK(reader.read_until_idle(40ms).status == ReadStatus::Timeout);
    CHECK(reader.read_until_terminator("\r", 40ms).status == ReadStatus::Timeout);
    CHECK(reader.read_fixed_frame(0x07, 9, 40ms).status == ReadStatus::Timeout);
    CHECK(std::chrono::steady_clock::now() - t0 < 1000ms);
}

TEST_CASE("read() dispatches on the read strategy") {
    FakeSerialPort port;
    port.feed(bytes_of("0011030906001500026\rX"));
    FrameReader reader(port);

    ReadSpec spec;
    spec.strategy = ReadStrategy::Terminator;
    spec.terminator = "\r";
    auto r = reader.read(spec, 200ms);
    REQUIRE(r.status == ReadStatus::Complete);
    CHECK(r.bytes.back() == '\r');
    CHECK(std::string(read_status_name(r.status)) == "complete");
}

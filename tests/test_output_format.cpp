#include <doctest/doctest.h>
#include "gaugelink/output_format.hpp"

using namespace gaugelink;

TEST_CASE("Bytes render in every display format") {
    const Bytes b{0x48, 0x69, 0x0D, 0xFF};
    CHECK(format_bytes(b, OutputFormat::Hex) == "48 69 0d ff");
    CHECK(format_bytes(b, OutputFormat::Binary) == "01001000 01101001 00001101 11111111");
    CHECK(format_bytes(b, OutputFormat::Decimal) == "72 105 13 255");
    CHECK(format_bytes(b, OutputFormat::Ascii) == "Hi\r?");
    CHECK(format_bytes(b, OutputFormat::Raw) == "b'Hi\\r\\xff'");
    CHECK(format_bytes(b, OutputFormat::Utf8) == "Hi\r\xEF\xBF\xBD");
}

TEST_CASE("Valid UTF-8 passes through") {
    const Bytes b{'C', 0xC2, 0xB0};
    CHECK(format_bytes(b, OutputFormat::Utf8) == "C\xC2\xB0");
}

TEST_CASE("Empty replies say so") {
    CHECK(format_bytes(Bytes{}, OutputFormat::Hex) == "No response");
    CHECK(format_bytes(Bytes{}, OutputFormat::Raw) == "No response");
}

TEST_CASE("Format names parse case-insensitively") {
    OutputFormat f = OutputFormat::Hex;
    REQUIRE(output_format_from_name("ASCII", f));
    CHECK(f == OutputFormat::Ascii);
    REQUIRE(output_format_from_name("utf8", f));
    CHECK(f == OutputFormat::Utf8);
    REQUIRE(output_format_from_name("Raw Bytes", f));
    CHECK(f == OutputFormat::Raw);
    CHECK_FALSE(output_format_from_name("octal", f));
    CHECK(std::string(output_format_name(OutputFormat::Utf8)) == "UTF-8");
}

TEST_CASE("Upper-case hex for logs") {
    CHECK(hex_upper(Bytes{0x0a, 0xbc}) == "0A BC");
    CHECK(hex_upper(Bytes{}).empty());
}

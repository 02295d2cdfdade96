#include <doctest/doctest.h>
#include "gaugelink/param_codec.hpp"
#include "gaugelink/types.hpp"

#include <cmath>

using namespace gaugelink;

static ParamValue round_trip(const ParamType& t, const ParamValue& v) {
    Bytes wire;
    std::string err;
    REQUIRE(encode_param(t, v, wire, err));
    CHECK(wire.size() == t.width);
    ParamValue back;
    REQUIRE(decode_param(t, wire, back, err));
    return back;
}

TEST_CASE("Bool and UInt8 survive every value") {
    CHECK(std::get<bool>(round_trip(ParamType::boolean(), true)) == true);
    CHECK(std::get<bool>(round_trip(ParamType::boolean(), false)) == false);
    for (long long v = 0; v <= 255; ++v) {
        CHECK(std::get<long long>(round_trip(ParamType::u8(), v)) == v);
    }
}

TEST_CASE("Wide unsigned values are big-endian") {
    Bytes wire;
    std::string err;
    REQUIRE(encode_param(ParamType::u16(), 0x1234LL, wire, err));
    CHECK(wire == Bytes{0x12, 0x34});

    wire.clear();
    REQUIRE(encode_param(ParamType::u32(), 0xDEADBEEFLL, wire, err));
    CHECK(wire == Bytes{0xDE, 0xAD, 0xBE, 0xEF});

    for (long long v : {0LL, 1LL, 65535LL, 4294967295LL}) {
        CHECK(std::get<long long>(round_trip(ParamType::u32(), v)) == v);
    }
}

TEST_CASE("Unsigned encode rejects values that do not fit and leaves output alone") {
    Bytes wire{0xAA};
    std::string err;
    CHECK_FALSE(encode_param(ParamType::u8(), 256LL, wire, err));
    CHECK(err == "encode_error:out_of_range(0..255)");
    CHECK(wire == Bytes{0xAA});

    CHECK_FALSE(encode_param(ParamType::u16(), -1LL, wire, err));
    CHECK_FALSE(encode_param(ParamType::u8(), std::string("abc"), wire, err));
    CHECK(err == "encode_error:not_an_integer");
}

TEST_CASE("Float32 is IEEE-754 big-endian and exact to float precision") {
    Bytes wire;
    std::string err;
    REQUIRE(encode_param(ParamType::float32(), 1.0, wire, err));
    CHECK(wire == Bytes{0x3F, 0x80, 0x00, 0x00});
    CHECK(std::get<double>(round_trip(ParamType::float32(), 23.5)) == doctest::Approx(23.5));
    CHECK(std::get<double>(round_trip(ParamType::float32(), -0.1)) == doctest::Approx(-0.1).epsilon(1e-7));
}

TEST_CASE("FixedPointEn20 scales by 2^20 and keeps the sign") {
    Bytes wire;
    std::string err;
    REQUIRE(encode_param(ParamType::fixed_en20(), 1.0, wire, err));
    CHECK(wire == Bytes{0x00, 0x10, 0x00, 0x00});

    ParamValue v;
    REQUIRE(decode_param(ParamType::fixed_en20(), Bytes{0xFF, 0xF0, 0x00, 0x00}, v, err));
    CHECK(std::get<double>(v) == doctest::Approx(-1.0));

    for (double d : {0.0, 1013.25, -40.5, 1.0 / 1048576.0}) {
        CHECK(std::get<double>(round_trip(ParamType::fixed_en20(), d)) == doctest::Approx(d));
    }
}

TEST_CASE("LogFixedPointEn26 round-trips 1 mbar and refuses zero") {
    const ParamValue one = round_trip(ParamType::log_fixed_en26(), 1.0);
    CHECK(std::fabs(std::get<double>(one) - 1.0) < 1e-6);

    const ParamValue low = round_trip(ParamType::log_fixed_en26(), 3.2e-9);
    CHECK(std::fabs(std::get<double>(low) - 3.2e-9) / 3.2e-9 < 1e-6);

    Bytes wire;
    std::string err;
    CHECK_FALSE(encode_param(ParamType::log_fixed_en26(), 0.0, wire, err));
    CHECK(err == "encode_error:log_fixed_requires_positive");
    CHECK_FALSE(encode_param(ParamType::log_fixed_en26(), -5.0, wire, err));
    CHECK(wire.empty());
}

TEST_CASE("ASCII fixed width pads, truncates and refuses 8-bit text") {
    Bytes wire;
    std::string err;
    REQUIRE(encode_param(ParamType::ascii(6), std::string("AB"), wire, err));
    CHECK(std::string(wire.begin(), wire.end()) == "AB    ");

    wire.clear();
    REQUIRE(encode_param(ParamType::ascii(3), std::string("ABCDEF"), wire, err));
    CHECK(std::string(wire.begin(), wire.end()) == "ABC");

    wire.clear();
    CHECK_FALSE(encode_param(ParamType::ascii(6), std::string("\xC3\xA9"), wire, err));
    CHECK(err == "encode_error:non_ascii");
}

TEST_CASE("Turbo ASCII fields are six characters") {
    Bytes wire;
    std::string err;
    REQUIRE(encode_param(ParamType::ascii_boolean_old(), true, wire, err));
    CHECK(std::string(wire.begin(), wire.end()) == "111111");

    wire.clear();
    REQUIRE(encode_param(ParamType::ascii_u_integer(), 50LL, wire, err));
    CHECK(std::string(wire.begin(), wire.end()) == "000050");

    wire.clear();
    REQUIRE(encode_param(ParamType::ascii_u_real(), 12.34, wire, err));
    CHECK(std::string(wire.begin(), wire.end()) == "001234");

    wire.clear();
    CHECK_FALSE(encode_param(ParamType::ascii_u_integer(), 1000000LL, wire, err));
    CHECK(err == "encode_error:out_of_range(0..999999)");
}

TEST_CASE("Decoding a short field is an error, not a crash") {
    ParamValue v;
    std::string err;
    CHECK_FALSE(decode_param(ParamType::u32(), Bytes{0x01, 0x02}, v, err));
    CHECK(err == "decode_error:expected_4_bytes_got_2");
}

TEST_CASE("The None kind has no wire form") {
    Bytes wire;
    std::string err;
    ParamValue v;
    CHECK_THROWS_AS(encode_param(ParamType::none(), 1LL, wire, err), UnsupportedParamType);
    CHECK_THROWS_AS(decode_param(ParamType::none(), Bytes{0x01}, v, err), UnsupportedParamType);
}

TEST_CASE("Text values parse as decimal unless prefixed with 0x") {
    long long i = 0;
    REQUIRE(value_to_integer(ParamValue(std::string("010")), i));
    CHECK(i == 10);
    REQUIRE(value_to_integer(ParamValue(std::string(" 050 ")), i));
    CHECK(i == 50);
    REQUIRE(value_to_integer(ParamValue(std::string("0x1F")), i));
    CHECK(i == 31);
    REQUIRE(value_to_integer(ParamValue(std::string("50.0")), i));
    CHECK(i == 50);
    CHECK_FALSE(value_to_integer(ParamValue(std::string("50.5")), i));
    CHECK_FALSE(value_to_integer(ParamValue(std::string("0x")), i));

    double d = 0.0;
    REQUIRE(value_to_double(ParamValue(std::string("010")), d));
    CHECK(d == doctest::Approx(10.0));
}

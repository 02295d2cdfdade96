#include <doctest/doctest.h>
#include "gaugelink/checksum.hpp"

#include <string>

using namespace gaugelink;

TEST_CASE("crc16_ccitt matches the CCITT-FALSE check value") {
    const std::string check = "123456789";
    CHECK(crc16_ccitt(reinterpret_cast<const uint8_t*>(check.data()), check.size()) == 0x29B1);
}

TEST_CASE("crc16_ccitt of nothing is the initial value") {
    CHECK(crc16_ccitt(Bytes{}) == 0xFFFF);
}

TEST_CASE("additive_checksum wraps modulo 256") {
    CHECK(additive_checksum(Bytes{0x00, 0x10, 0x00}) == 0x10);
    CHECK(additive_checksum(Bytes{0xFF, 0x02}) == 0x01);
    CHECK(additive_checksum(std::string("0010030902=?")) == static_cast<uint8_t>(
          '0' + '0' + '1' + '0' + '0' + '3' + '0' + '9' + '0' + '2' + '=' + '?'));
}

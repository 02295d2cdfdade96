// ============================================================================
// checksum.cpp - implementation for checksum.hpp
// ============================================================================

#include "gaugelink/checksum.hpp"

namespace gaugelink {

// ---------------------------------------------------------------------------
// crc16_ccitt()
// -------------
// Bit-at-a-time CRC, MSB first. Every binary-family codec must agree on this
// byte for byte, so no table variant is kept alongside it.
// ---------------------------------------------------------------------------
uint16_t crc16_ccitt(const uint8_t* data, std::size_t len) {
    uint16_t crc = 0xFFFF;
    for (std::size_t i = 0; i < len; ++i) {
        crc ^= static_cast<uint16_t>(data[i]) << 8;
        for (int bit = 0; bit < 8; ++bit) {
            if (crc & 0x8000) crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
            else              crc = static_cast<uint16_t>(crc << 1);
        }
    }
    return crc;
}

uint8_t additive_checksum(const uint8_t* data, std::size_t len) {
    unsigned sum = 0;
    for (std::size_t i = 0; i < len; ++i) sum += data[i];
    return static_cast<uint8_t>(sum & 0xFF);
}

} // namespace gaugelink

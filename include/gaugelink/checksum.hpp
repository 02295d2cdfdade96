#pragma once
/**
 * @file checksum.hpp
 * @brief CRC16-CCITT and additive checksums used by the gauge wire formats.
 *
 * @details
 * Two integrity schemes cover every supported device family:
 *
 * - crc16_ccitt(): CRC-16/CCITT-FALSE (poly 0x1021, init 0xFFFF, MSB first,
 *   no final XOR). The Pfeiffer binary family appends it little-endian.
 * - additive_checksum(): plain sum of bytes modulo 256. The capacitance gauges
 *   use it over bytes 1..3 of a command and 1..7 of a response; the turbo
 *   controller uses it over the ASCII characters of a telegram.
 *
 * Both are pure functions with no error conditions.
 *
 * EXAMPLE
 * -------
 * @code
 *   const uint8_t check[] = {'1','2','3','4','5','6','7','8','9'};
 *   uint16_t crc = gaugelink::crc16_ccitt(check, sizeof(check)); // 0x29B1
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace gaugelink {

/** @brief CRC-16/CCITT-FALSE over @p len bytes. */
uint16_t crc16_ccitt(const uint8_t* data, std::size_t len);

inline uint16_t crc16_ccitt(const std::vector<uint8_t>& data) {
    return crc16_ccitt(data.data(), data.size());
}

/** @brief Sum of @p len bytes modulo 256. */
uint8_t additive_checksum(const uint8_t* data, std::size_t len);

inline uint8_t additive_checksum(const std::vector<uint8_t>& data) {
    return additive_checksum(data.data(), data.size());
}

inline uint8_t additive_checksum(const std::string& text) {
    return additive_checksum(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

} // namespace gaugelink

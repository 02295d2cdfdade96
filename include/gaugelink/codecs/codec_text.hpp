#pragma once
/**
 * @file codec_text.hpp
 * @brief Small text helpers shared by the codec decoders.
 */

#include <cstdint>
#include <cstdio>
#include <string>

#include "gaugelink/types.hpp"

namespace gaugelink::codecs {

/// "1.23E-03" style, the notation gauge front panels use for pressure.
inline std::string sci(double v, int digits = 2) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.*E", digits, v);
    return buf;
}

/// Fixed notation with @p digits decimals.
inline std::string fixed(double v, int digits = 2) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.*f", digits, v);
    return buf;
}

/// Payload bytes as text with NUL padding and surrounding spaces removed.
inline std::string trimmed_text(const uint8_t* data, std::size_t len) {
    std::string s(reinterpret_cast<const char*>(data), len);
    const char* ws = " \t\r\n";
    std::size_t nul = s.find('\0');
    if (nul != std::string::npos) s.resize(nul);
    std::size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    std::size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

inline std::string trimmed_text(const std::string& s) {
    return trimmed_text(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

/// "value unit", or just "value" when @p unit is empty.
inline std::string with_unit(const std::string& value, const std::string& unit) {
    return unit.empty() ? value : value + " " + unit;
}

} // namespace gaugelink::codecs

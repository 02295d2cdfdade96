#pragma once
/**
 * @file output_format.hpp
 * @brief Render raw frames as Hex, Binary, ASCII, UTF-8, Decimal or Raw text.
 *
 * Used by the transports for frame logging and the DeviceResponse::display
 * field, and by the CLI for manual commands.
 */

#include <cstdint>
#include <string>

#include "gaugelink/types.hpp"

namespace gaugelink {

enum class OutputFormat : uint8_t { Hex = 0, Binary, Ascii, Utf8, Decimal, Raw };

/// "Hex", "Binary", "ASCII", "UTF-8", "Decimal", "Raw".
const char* output_format_name(OutputFormat f);

/// Case-insensitive; also accepts "utf8" and "raw bytes".
bool output_format_from_name(const std::string& name, OutputFormat& out);

/**
 * @brief Render @p bytes in format @p f.
 *
 * - Hex: "07 00 80" (lowercase, space separated)
 * - Binary: "00000111 00000000"
 * - ASCII: bytes above 0x7F become '?'
 * - UTF-8: invalid sequences become U+FFFD
 * - Decimal: "7 0 128"
 * - Raw: b'...' literal with \\xNN escapes
 *
 * An empty buffer renders as "No response".
 */
std::string format_bytes(const Bytes& bytes, OutputFormat f);

/// Uppercase "07 00 80" hex dump used in decoded text.
std::string hex_upper(const uint8_t* data, std::size_t len);

inline std::string hex_upper(const Bytes& b) { return hex_upper(b.data(), b.size()); }

} // namespace gaugelink

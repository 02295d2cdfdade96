#pragma once
/**
 * @file manual_command.hpp
 * @brief Free-text to bytes for the "send anything" diagnostic path.
 *
 * @details
 * PURPOSE
 * -------
 * A technician types whatever the device manual shows: "03 00 10 00 10",
 * "0x03 0x00", "\x03\x00", "3,0,16", "10100000" or "@254PR3?\". classify()
 * guesses which of those it is, to_bytes() turns it into a frame. Nothing
 * here knows about catalogs or codecs.
 *
 * CLASSIFICATION ORDER (first match wins, input trimmed first)
 * -----------------------------------------------------------
 *   1. Binary      only '0', '1' and spaces         "1010 0011"
 *   2. HexPrefixed starts with 0x or has " 0x"       "0x03 0x00"
 *   3. HexEscaped  contains \x                       "\x03\x00"
 *   4. Decimal     every whitespace token is digits  "3 0 16"
 *   5. DecimalCsv  has ',' and every field digits    "3,0,16"
 *   6. Hex         only hex digits and spaces        "03 00 10"
 *   7. Ascii       anything else (always succeeds)
 *
 * Empty input classifies as Ascii.
 *
 * Note the order makes "10 11" Binary, not Decimal or Hex. That matches
 * what bench users expect from bit patterns and is kept deliberately.
 */

#include <string>

#include "gaugelink/output_format.hpp"
#include "gaugelink/types.hpp"

namespace gaugelink::manual {

enum class InputFormat : uint8_t { Binary = 0, HexPrefixed, HexEscaped, Decimal, DecimalCsv, Hex, Ascii };

const char* input_format_name(InputFormat f);

struct Classification {
    InputFormat format{InputFormat::Ascii};
    std::string normalized;   ///< input with prefixes/spaces removed where the format allows
};

Classification classify(const std::string& text);

/**
 * @brief Convert @p text, already in @p format, to bytes.
 *
 * - Binary: right-padded with '0' to a multiple of 8 bits ("1" -> 0x80).
 * - Hex variants: prefixes, escapes and spaces are ignored; the digit count
 *   must be even.
 * - Decimal / DecimalCsv: each value 0..255.
 * - Ascii: 7-bit characters only.
 *
 * Failures fill @p err with "conversion_error:<detail>"; @p out is left
 * untouched, so a bad input is never partially sent.
 */
bool to_bytes(InputFormat format, const std::string& text, Bytes& out, std::string& err);

/// classify() followed by to_bytes() on the normalized text.
bool encode(const std::string& text, Bytes& out, std::string& err, InputFormat* detected = nullptr);

/**
 * @brief Advisory display format for a reply.
 *
 * ASCII when every byte is printable or CR/LF, else Hex when any byte is
 * above 127, else Decimal when every byte is below 100, else Hex. Empty
 * input suggests Hex.
 */
OutputFormat suggest_display_format(const Bytes& bytes);

} // namespace gaugelink::manual

// ============================================================================
// output_format.cpp - implementation for output_format.hpp
// ============================================================================

#include "gaugelink/output_format.hpp"

#include <cctype>
#include <cstdio>

namespace gaugelink {

namespace {

const char* const kReplacement = "\xEF\xBF\xBD";   // U+FFFD

std::string lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Length of a valid UTF-8 sequence starting at data[i], or 0 when invalid.
std::size_t utf8_sequence(const Bytes& data, std::size_t i) {
    const uint8_t c = data[i];
    std::size_t n = 0;
    if (c < 0x80)                n = 1;
    else if ((c & 0xE0) == 0xC0) n = (c >= 0xC2) ? 2 : 0;
    else if ((c & 0xF0) == 0xE0) n = 3;
    else if ((c & 0xF8) == 0xF0) n = (c <= 0xF4) ? 4 : 0;
    if (n == 0 || i + n > data.size()) return 0;
    for (std::size_t k = 1; k < n; ++k) {
        if ((data[i + k] & 0xC0) != 0x80) return 0;
    }
    return n;
}

} // namespace

const char* output_format_name(OutputFormat f) {
    switch (f) {
        case OutputFormat::Hex:     return "Hex";
        case OutputFormat::Binary:  return "Binary";
        case OutputFormat::Ascii:   return "ASCII";
        case OutputFormat::Utf8:    return "UTF-8";
        case OutputFormat::Decimal: return "Decimal";
        case OutputFormat::Raw:     return "Raw";
    }
    return "Hex";
}

bool output_format_from_name(const std::string& name, OutputFormat& out) {
    const std::string n = lower(name);
    if (n == "hex")                         { out = OutputFormat::Hex;     return true; }
    if (n == "binary")                      { out = OutputFormat::Binary;  return true; }
    if (n == "ascii")                       { out = OutputFormat::Ascii;   return true; }
    if (n == "utf-8" || n == "utf8")        { out = OutputFormat::Utf8;    return true; }
    if (n == "decimal")                     { out = OutputFormat::Decimal; return true; }
    if (n == "raw" || n == "raw bytes")     { out = OutputFormat::Raw;     return true; }
    return false;
}

std::string hex_upper(const uint8_t* data, std::size_t len) {
    std::string s;
    s.reserve(len * 3);
    char buf[4];
    for (std::size_t i = 0; i < len; ++i) {
        std::snprintf(buf, sizeof(buf), "%02X", data[i]);
        if (i) s.push_back(' ');
        s += buf;
    }
    return s;
}

std::string format_bytes(const Bytes& bytes, OutputFormat f) {
    if (bytes.empty()) return "No response";

    std::string s;
    char buf[12];
    switch (f) {
        case OutputFormat::Hex:
            for (std::size_t i = 0; i < bytes.size(); ++i) {
                std::snprintf(buf, sizeof(buf), "%02x", bytes[i]);
                if (i) s.push_back(' ');
                s += buf;
            }
            break;

        case OutputFormat::Binary:
            for (std::size_t i = 0; i < bytes.size(); ++i) {
                if (i) s.push_back(' ');
                for (int bit = 7; bit >= 0; --bit) s.push_back(((bytes[i] >> bit) & 1) ? '1' : '0');
            }
            break;

        case OutputFormat::Ascii:
            for (uint8_t b : bytes) s.push_back(b < 0x80 ? static_cast<char>(b) : '?');
            break;

        case OutputFormat::Utf8:
            for (std::size_t i = 0; i < bytes.size();) {
                std::size_t n = utf8_sequence(bytes, i);
                if (n == 0) { s += kReplacement; ++i; continue; }
                s.append(reinterpret_cast<const char*>(&bytes[i]), n);
                i += n;
            }
            break;

        case OutputFormat::Decimal:
            for (std::size_t i = 0; i < bytes.size(); ++i) {
                if (i) s.push_back(' ');
                s += std::to_string(bytes[i]);
            }
            break;

        case OutputFormat::Raw:
            s = "b'";
            for (uint8_t b : bytes) {
                if (b == '\\' || b == '\'') { s.push_back('\\'); s.push_back(static_cast<char>(b)); }
                else if (b == '\r')         s += "\\r";
                else if (b == '\n')         s += "\\n";
                else if (b == '\t')         s += "\\t";
                else if (b >= 0x20 && b < 0x7F) s.push_back(static_cast<char>(b));
                else { std::snprintf(buf, sizeof(buf), "\\x%02x", b); s += buf; }
            }
            s.push_back('\'');
            break;
    }
    return s;
}

} // namespace gaugelink

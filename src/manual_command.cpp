// ============================================================================
// manual_command.cpp - implementation for manual_command.hpp
// ============================================================================

#include "gaugelink/manual_command.hpp"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <vector>

namespace gaugelink::manual {

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string erase_all(std::string s, const std::string& what) {
    if (what.empty()) return s;
    std::size_t pos = 0;
    while ((pos = s.find(what, pos)) != std::string::npos) s.erase(pos, what.size());
    return s;
}

std::string without_spaces(const std::string& s) { return erase_all(s, " "); }

bool only_chars(const std::string& s, const char* allowed) {
    for (char c : s) {
        if (!std::strchr(allowed, c)) return false;
    }
    return true;
}

bool is_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream is(s);
    std::string tok;
    while (is >> tok) out.push_back(tok);
    return out;
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        std::size_t comma = s.find(',', start);
        out.push_back(trim(s.substr(start, comma == std::string::npos ? std::string::npos : comma - start)));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool hex_to_bytes(const std::string& digits, Bytes& out, std::string& err) {
    if (digits.size() % 2 != 0) { err = "conversion_error:odd_hex_digit_count"; return false; }
    Bytes b;
    b.reserve(digits.size() / 2);
    for (std::size_t i = 0; i < digits.size(); i += 2) {
        int hi = hex_value(digits[i]);
        int lo = hex_value(digits[i + 1]);
        if (hi < 0 || lo < 0) { err = "conversion_error:invalid_hex_digit"; return false; }
        b.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    out = std::move(b);
    return true;
}

bool decimals_to_bytes(const std::vector<std::string>& tokens, Bytes& out, std::string& err) {
    Bytes b;
    for (const auto& t : tokens) {
        if (!is_digits(t)) { err = "conversion_error:not_a_number(" + t + ")"; return false; }
        if (t.size() > 3 || std::atoi(t.c_str()) > 255) {
            err = "conversion_error:out_of_range(" + t + ")";
            return false;
        }
        b.push_back(static_cast<uint8_t>(std::atoi(t.c_str())));
    }
    out = std::move(b);
    return true;
}

} // namespace

const char* input_format_name(InputFormat f) {
    switch (f) {
        case InputFormat::Binary:      return "binary";
        case InputFormat::HexPrefixed: return "hex_prefixed";
        case InputFormat::HexEscaped:  return "hex_escaped";
        case InputFormat::Decimal:     return "decimal";
        case InputFormat::DecimalCsv:  return "decimal_csv";
        case InputFormat::Hex:         return "hex";
        case InputFormat::Ascii:       return "ascii";
    }
    return "ascii";
}

Classification classify(const std::string& text) {
    const std::string s = trim(text);
    if (s.empty()) return {InputFormat::Ascii, s};

    if (only_chars(s, "01 ")) return {InputFormat::Binary, without_spaces(s)};

    const std::string lo = lower(s);
    if (lo.rfind("0x", 0) == 0 || lo.find(" 0x") != std::string::npos)
        return {InputFormat::HexPrefixed, without_spaces(erase_all(lo, "0x"))};

    if (s.find("\\x") != std::string::npos)
        return {InputFormat::HexEscaped, without_spaces(erase_all(s, "\\x"))};

    const auto words = split_ws(s);
    bool all_dec = !words.empty();
    for (const auto& w : words) all_dec = all_dec && is_digits(w);
    if (all_dec) return {InputFormat::Decimal, s};

    if (s.find(',') != std::string::npos) {
        bool csv = true;
        for (const auto& f : split_csv(s)) csv = csv && is_digits(f);
        if (csv) return {InputFormat::DecimalCsv, s};
    }

    if (only_chars(s, "0123456789ABCDEFabcdef ")) return {InputFormat::Hex, without_spaces(s)};

    return {InputFormat::Ascii, s};
}

bool to_bytes(InputFormat format, const std::string& text, Bytes& out, std::string& err) {
    switch (format) {
        case InputFormat::Binary: {
            std::string bits = without_spaces(text);
            if (!only_chars(bits, "01")) { err = "conversion_error:invalid_binary_digit"; return false; }
            while (bits.size() % 8 != 0) bits.push_back('0');
            Bytes b;
            for (std::size_t i = 0; i < bits.size(); i += 8) {
                b.push_back(static_cast<uint8_t>(std::strtoul(bits.substr(i, 8).c_str(), nullptr, 2)));
            }
            out = std::move(b);
            return true;
        }
        case InputFormat::HexPrefixed:
            return hex_to_bytes(without_spaces(erase_all(lower(text), "0x")), out, err);
        case InputFormat::HexEscaped:
            return hex_to_bytes(without_spaces(erase_all(text, "\\x")), out, err);
        case InputFormat::Hex:
            return hex_to_bytes(without_spaces(text), out, err);
        case InputFormat::Decimal:
        case InputFormat::DecimalCsv:
            if (text.find(',') != std::string::npos) return decimals_to_bytes(split_csv(trim(text)), out, err);
            return decimals_to_bytes(split_ws(text), out, err);
        case InputFormat::Ascii:
            for (char c : text) {
                if (static_cast<unsigned char>(c) > 0x7F) { err = "conversion_error:non_ascii"; return false; }
            }
            out.assign(text.begin(), text.end());
            return true;
    }
    err = "conversion_error:unsupported_format";
    return false;
}

bool encode(const std::string& text, Bytes& out, std::string& err, InputFormat* detected) {
    Classification c = classify(text);
    if (detected) *detected = c.format;
    return to_bytes(c.format, c.normalized, out, err);
}

OutputFormat suggest_display_format(const Bytes& bytes) {
    if (bytes.empty()) return OutputFormat::Hex;

    bool printable = true;
    for (uint8_t b : bytes) {
        if (!((b >= 32 && b <= 126) || b == '\r' || b == '\n')) { printable = false; break; }
    }
    if (printable) return OutputFormat::Ascii;

    for (uint8_t b : bytes) {
        if (b > 127) return OutputFormat::Hex;
    }
    for (uint8_t b : bytes) {
        if (b >= 100) return OutputFormat::Hex;
    }
    return OutputFormat::Decimal;
}

} // namespace gaugelink::manual

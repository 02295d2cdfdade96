// ============================================================================
// param_codec.cpp - implementation for param_codec.hpp
// For the wire table and precision notes see the matching .hpp.
// ============================================================================

#include "gaugelink/param_codec.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace gaugelink {

namespace {

constexpr double kEn20 = 1048576.0;     // 2^20
constexpr double kEn26 = 67108864.0;    // 2^26

// ---------------------------------------------------------------------------
// Big-endian helpers. Every multi-byte field in the supported protocols is
// big-endian; only the Pfeiffer CRC trailer is little-endian and that is
// handled by the codec itself.
// ---------------------------------------------------------------------------
void put_be(Bytes& out, uint32_t v, int width) {
    for (int i = width - 1; i >= 0; --i)
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

uint32_t get_be(const uint8_t* p, int width) {
    uint32_t v = 0;
    for (int i = 0; i < width; ++i) v = (v << 8) | p[i];
    return v;
}

bool fits_i32(double raw) {
    return raw >= static_cast<double>(std::numeric_limits<int32_t>::min()) &&
           raw <= static_cast<double>(std::numeric_limits<int32_t>::max());
}

std::string six_digits(long long v) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%06lld", v);
    return buf;
}

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) if (c < '0' || c > '9') return false;
    return true;
}

std::string strip_spaces(const uint8_t* data, std::size_t len) {
    std::string s(reinterpret_cast<const char*>(data), len);
    std::size_t b = s.find_first_not_of(' ');
    if (b == std::string::npos) return {};
    std::size_t e = s.find_last_not_of(' ');
    return s.substr(b, e - b + 1);
}

bool encode_unsigned(const ParamValue& value, int width, Bytes& out, std::string& err) {
    long long v = 0;
    if (!value_to_integer(value, v)) { err = "encode_error:not_an_integer"; return false; }
    const long long hi = (width == 4) ? 0xFFFFFFFFll : ((1ll << (8 * width)) - 1);
    if (v < 0 || v > hi) {
        err = "encode_error:out_of_range(0.." + std::to_string(hi) + ")";
        return false;
    }
    put_be(out, static_cast<uint32_t>(v), width);
    return true;
}

} // namespace

std::string param_type_name(const ParamType& t) {
    switch (t.kind) {
        case ParamType::Kind::None:              return "none";
        case ParamType::Kind::Bool:              return "bool";
        case ParamType::Kind::UInt8:             return "u8";
        case ParamType::Kind::UInt16:            return "u16";
        case ParamType::Kind::UInt32:            return "u32";
        case ParamType::Kind::Float32:           return "float32";
        case ParamType::Kind::FixedPointEn20:    return "fixed_en20";
        case ParamType::Kind::LogFixedPointEn26: return "log_fixed_en26";
        case ParamType::Kind::AsciiFixedWidth:   return "ascii(" + std::to_string(t.width) + ")";
        case ParamType::Kind::AsciiBooleanOld:   return "boolean_old";
        case ParamType::Kind::AsciiUInteger:     return "u_integer";
        case ParamType::Kind::AsciiUReal:        return "u_real";
    }
    return "kind#" + std::to_string(static_cast<unsigned>(t.kind));
}

bool encode_param(const ParamType& type, const ParamValue& value, Bytes& out, std::string& err) {
    Bytes b;
    switch (type.kind) {
        case ParamType::Kind::Bool: {
            bool v = false;
            if (!value_to_bool(value, v)) { err = "encode_error:not_a_bool"; return false; }
            b.push_back(v ? 1 : 0);
            break;
        }
        case ParamType::Kind::UInt8:
            if (!encode_unsigned(value, 1, b, err)) return false;
            break;
        case ParamType::Kind::UInt16:
            if (!encode_unsigned(value, 2, b, err)) return false;
            break;
        case ParamType::Kind::UInt32:
            if (!encode_unsigned(value, 4, b, err)) return false;
            break;
        case ParamType::Kind::Float32: {
            double d = 0.0;
            if (!value_to_double(value, d)) { err = "encode_error:not_a_number"; return false; }
            if (std::fabs(d) > std::numeric_limits<float>::max()) {
                err = "encode_error:float32_overflow";
                return false;
            }
            float f = static_cast<float>(d);
            uint32_t bits = 0;
            std::memcpy(&bits, &f, sizeof(bits));
            put_be(b, bits, 4);
            break;
        }
        case ParamType::Kind::FixedPointEn20: {
            double d = 0.0;
            if (!value_to_double(value, d)) { err = "encode_error:not_a_number"; return false; }
            double raw = std::round(d * kEn20);
            if (!fits_i32(raw)) { err = "encode_error:fixed_en20_overflow"; return false; }
            put_be(b, static_cast<uint32_t>(static_cast<int32_t>(raw)), 4);
            break;
        }
        case ParamType::Kind::LogFixedPointEn26: {
            double d = 0.0;
            if (!value_to_double(value, d)) { err = "encode_error:not_a_number"; return false; }
            if (!(d > 0.0)) { err = "encode_error:log_fixed_requires_positive"; return false; }
            double raw = std::round(std::log10(d) * kEn26);
            if (!fits_i32(raw)) { err = "encode_error:log_fixed_en26_overflow"; return false; }
            put_be(b, static_cast<uint32_t>(static_cast<int32_t>(raw)), 4);
            break;
        }
        case ParamType::Kind::AsciiFixedWidth: {
            std::string s = value_to_string(value);
            for (char c : s) {
                if (static_cast<unsigned char>(c) > 0x7F) { err = "encode_error:non_ascii"; return false; }
            }
            if (s.size() > type.width) s.resize(type.width);
            s.append(type.width - s.size(), ' ');
            b.insert(b.end(), s.begin(), s.end());
            break;
        }
        case ParamType::Kind::AsciiBooleanOld: {
            bool v = false;
            if (!value_to_bool(value, v)) { err = "encode_error:not_a_bool"; return false; }
            const char* s = v ? "111111" : "000000";
            b.insert(b.end(), s, s + 6);
            break;
        }
        case ParamType::Kind::AsciiUInteger: {
            long long v = 0;
            if (!value_to_integer(value, v)) { err = "encode_error:not_an_integer"; return false; }
            if (v < 0 || v > 999999) { err = "encode_error:out_of_range(0..999999)"; return false; }
            std::string s = six_digits(v);
            b.insert(b.end(), s.begin(), s.end());
            break;
        }
        case ParamType::Kind::AsciiUReal: {
            double d = 0.0;
            if (!value_to_double(value, d)) { err = "encode_error:not_a_number"; return false; }
            double fixed = std::round(d * 100.0);
            if (fixed < 0 || fixed > 999999) { err = "encode_error:out_of_range(0..9999.99)"; return false; }
            std::string s = six_digits(static_cast<long long>(fixed));
            b.insert(b.end(), s.begin(), s.end());
            break;
        }
        default:
            throw UnsupportedParamType(param_type_name(type));
    }
    out.insert(out.end(), b.begin(), b.end());
    return true;
}

bool decode_param(const ParamType& type, const uint8_t* data, std::size_t len,
                  ParamValue& out, std::string& err) {
    auto need = [&](std::size_t n) {
        if (len == n) return true;
        err = "decode_error:expected_" + std::to_string(n) + "_bytes_got_" + std::to_string(len);
        return false;
    };

    switch (type.kind) {
        case ParamType::Kind::Bool:
            if (!need(1)) return false;
            out = (data[0] != 0);
            return true;
        case ParamType::Kind::UInt8:
            if (!need(1)) return false;
            out = static_cast<long long>(data[0]);
            return true;
        case ParamType::Kind::UInt16:
            if (!need(2)) return false;
            out = static_cast<long long>(get_be(data, 2));
            return true;
        case ParamType::Kind::UInt32:
            if (!need(4)) return false;
            out = static_cast<long long>(get_be(data, 4));
            return true;
        case ParamType::Kind::Float32: {
            if (!need(4)) return false;
            uint32_t bits = get_be(data, 4);
            float f = 0.0f;
            std::memcpy(&f, &bits, sizeof(f));
            out = static_cast<double>(f);
            return true;
        }
        case ParamType::Kind::FixedPointEn20: {
            if (!need(4)) return false;
            int32_t raw = static_cast<int32_t>(get_be(data, 4));
            out = static_cast<double>(raw) / kEn20;
            return true;
        }
        case ParamType::Kind::LogFixedPointEn26: {
            if (!need(4)) return false;
            int32_t raw = static_cast<int32_t>(get_be(data, 4));
            double v = std::pow(10.0, static_cast<double>(raw) / kEn26);
            if (!std::isfinite(v) || v == 0.0) { err = "decode_error:log_fixed_overflow"; return false; }
            out = v;
            return true;
        }
        case ParamType::Kind::AsciiFixedWidth: {
            std::string s(reinterpret_cast<const char*>(data), len);
            std::size_t e = s.find_last_not_of(' ');
            out = (e == std::string::npos) ? std::string() : s.substr(0, e + 1);
            return true;
        }
        case ParamType::Kind::AsciiBooleanOld: {
            std::string s = strip_spaces(data, len);
            if (!s.empty() && s.find_first_not_of('1') == std::string::npos) { out = true;  return true; }
            if (!s.empty() && s.find_first_not_of('0') == std::string::npos) { out = false; return true; }
            err = "decode_error:not_a_boolean_old_field";
            return false;
        }
        case ParamType::Kind::AsciiUInteger: {
            std::string s = strip_spaces(data, len);
            if (!all_digits(s)) { err = "decode_error:not_a_u_integer_field"; return false; }
            out = std::strtoll(s.c_str(), nullptr, 10);
            return true;
        }
        case ParamType::Kind::AsciiUReal: {
            std::string s = strip_spaces(data, len);
            if (!all_digits(s)) { err = "decode_error:not_a_u_real_field"; return false; }
            out = static_cast<double>(std::strtoll(s.c_str(), nullptr, 10)) / 100.0;
            return true;
        }
        default:
            throw UnsupportedParamType(param_type_name(type));
    }
}

} // namespace gaugelink

#pragma once
/**
 * @file param_codec.hpp
 * @brief Encode/decode device parameter values to and from wire bytes.
 *
 * @details
 * PURPOSE
 * -------
 * Every codec ends up needing the same few numeric conversions. They live here
 * so the frame code only decides *which* type a field has:
 *
 * | Kind              | Wire form                                            |
 * |-------------------|------------------------------------------------------|
 * | Bool              | 1 byte, 0 or 1                                       |
 * | UInt8/16/32       | N-byte big-endian unsigned                           |
 * | Float32           | IEEE-754 single, big-endian                          |
 * | FixedPointEn20    | signed 32-bit big-endian, value = raw / 2^20         |
 * | LogFixedPointEn26 | signed 32-bit big-endian, value = 10^(raw / 2^26)    |
 * | AsciiFixedWidth   | n ASCII chars, left-justified, space padded          |
 * | AsciiBooleanOld   | "111111" / "000000"                                  |
 * | AsciiUInteger     | 6-digit zero-padded decimal                          |
 * | AsciiUReal        | value x 100 as 6-digit zero-padded decimal           |
 *
 * ERRORS
 * ------
 * - A value that does not fit (out of range, wrong kind, non-positive input to
 *   the logarithmic encoding, non-ASCII text) is data: the call returns false
 *   and @p err holds "encode_error:<detail>" or "decode_error:<detail>".
 * - A kind this codec does not implement (ParamType::None, or an out-of-enum
 *   value) throws UnsupportedParamType.
 *
 * PRECISION
 * ---------
 * Integer kinds round-trip exactly. FixedPointEn20 round-trips exactly for
 * multiples of 2^-20 and AsciiUReal for multiples of 0.01. Float32 is exact
 * only to single precision, and LogFixedPointEn26 to about 3.4e-8 relative
 * error; both are expected for these encodings.
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "gaugelink/types.hpp"

namespace gaugelink {

struct ParamType {
    enum class Kind : uint8_t {
        None = 0,
        Bool,
        UInt8,
        UInt16,
        UInt32,
        Float32,
        FixedPointEn20,
        LogFixedPointEn26,
        AsciiFixedWidth,
        AsciiBooleanOld,
        AsciiUInteger,
        AsciiUReal
    };

    Kind kind{Kind::None};
    uint8_t width{0};   ///< wire width in bytes (characters for ASCII kinds)

    static constexpr ParamType none()                { return {Kind::None, 0}; }
    static constexpr ParamType boolean()             { return {Kind::Bool, 1}; }
    static constexpr ParamType u8()                  { return {Kind::UInt8, 1}; }
    static constexpr ParamType u16()                 { return {Kind::UInt16, 2}; }
    static constexpr ParamType u32()                 { return {Kind::UInt32, 4}; }
    static constexpr ParamType float32()             { return {Kind::Float32, 4}; }
    static constexpr ParamType fixed_en20()          { return {Kind::FixedPointEn20, 4}; }
    static constexpr ParamType log_fixed_en26()      { return {Kind::LogFixedPointEn26, 4}; }
    static constexpr ParamType ascii(uint8_t n)      { return {Kind::AsciiFixedWidth, n}; }
    static constexpr ParamType ascii_boolean_old()   { return {Kind::AsciiBooleanOld, 6}; }
    static constexpr ParamType ascii_u_integer()     { return {Kind::AsciiUInteger, 6}; }
    static constexpr ParamType ascii_u_real()        { return {Kind::AsciiUReal, 6}; }

    bool operator==(const ParamType& o) const { return kind == o.kind && width == o.width; }
    bool operator!=(const ParamType& o) const { return !(*this == o); }
};

/// Short lowercase name, e.g. "u16", "log_fixed_en26", "ascii(6)".
std::string param_type_name(const ParamType& t);

/**
 * @brief Append the wire form of @p value to @p out.
 * @return false with "encode_error:..." in @p err when the value does not fit;
 *         @p out is left untouched in that case.
 * @throws UnsupportedParamType for kinds without an encoder.
 */
bool encode_param(const ParamType& type, const ParamValue& value, Bytes& out, std::string& err);

/**
 * @brief Decode @p len bytes at @p data into @p out.
 *
 * Integer kinds yield long long, Bool yields bool, real kinds yield double,
 * AsciiFixedWidth yields the text with trailing spaces removed.
 *
 * @return false with "decode_error:..." in @p err on a short or malformed field.
 * @throws UnsupportedParamType for kinds without a decoder.
 */
bool decode_param(const ParamType& type, const uint8_t* data, std::size_t len,
                  ParamValue& out, std::string& err);

inline bool decode_param(const ParamType& type, const Bytes& data, ParamValue& out, std::string& err) {
    return decode_param(type, data.data(), data.size(), out, err);
}

} // namespace gaugelink

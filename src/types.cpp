// ============================================================================
// types.cpp - implementation for types.hpp
// ============================================================================

#include "gaugelink/types.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace gaugelink {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:        return "none";
        case ErrorKind::Connection:  return "connection";
        case ErrorKind::Timeout:     return "timeout";
        case ErrorKind::Framing:     return "framing";
        case ErrorKind::Device:      return "device";
        case ErrorKind::Encode:      return "encode";
        case ErrorKind::Conversion:  return "conversion";
        case ErrorKind::CallerError: return "caller_error";
    }
    return "unknown";
}

// ---------- local parsing helpers (no exceptions) ----------
// Same strtol/strtod approach as the CLI parsers: the whole string must be
// consumed, otherwise the value is rejected.

static std::string trimmed(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static bool parse_double(const std::string& s, double& out) {
    std::string t = trimmed(s);
    if (t.empty()) return false;
    char* e = nullptr;
    double v = std::strtod(t.c_str(), &e);
    if (!e || *e) return false;
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

// Decimal unless an explicit 0x prefix asks for hex; a leading zero is not
// octal, so "050" parses the same here as in parse_double().
static bool parse_integer(const std::string& s, long long& out) {
    std::string t = trimmed(s);
    if (t.empty()) return false;
    const bool hex = t.size() > 2 && t[0] == '0' && (t[1] == 'x' || t[1] == 'X');
    char* e = nullptr;
    long long v = std::strtoll(t.c_str(), &e, hex ? 16 : 10);
    if (e && !*e) { out = v; return true; }

    // Accept "50.0" but not "50.5".
    double d = 0.0;
    if (!parse_double(t, d) || std::floor(d) != d) return false;
    if (d < -9.0e18 || d > 9.0e18) return false;
    out = static_cast<long long>(d);
    return true;
}

bool value_to_double(const ParamValue& v, double& out) {
    if (auto b = std::get_if<bool>(&v))         { out = *b ? 1.0 : 0.0; return true; }
    if (auto i = std::get_if<long long>(&v))    { out = static_cast<double>(*i); return true; }
    if (auto d = std::get_if<double>(&v))       { out = *d; return std::isfinite(*d); }
    return parse_double(std::get<std::string>(v), out);
}

bool value_to_integer(const ParamValue& v, long long& out) {
    if (auto b = std::get_if<bool>(&v))      { out = *b ? 1 : 0; return true; }
    if (auto i = std::get_if<long long>(&v)) { out = *i; return true; }
    if (auto d = std::get_if<double>(&v)) {
        if (!std::isfinite(*d) || std::floor(*d) != *d) return false;
        if (*d < -9.0e18 || *d > 9.0e18) return false;
        out = static_cast<long long>(*d);
        return true;
    }
    return parse_integer(std::get<std::string>(v), out);
}

bool value_to_bool(const ParamValue& v, bool& out) {
    if (auto b = std::get_if<bool>(&v)) { out = *b; return true; }
    if (auto s = std::get_if<std::string>(&v)) {
        std::string t = trimmed(*s);
        for (char& c : t) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (t == "true" || t == "on" || t == "yes")  { out = true;  return true; }
        if (t == "false" || t == "off" || t == "no") { out = false; return true; }
    }
    long long i = 0;
    if (!value_to_integer(v, i)) return false;
    out = (i != 0);
    return true;
}

std::string value_to_string(const ParamValue& v) {
    if (auto b = std::get_if<bool>(&v))      return *b ? "1" : "0";
    if (auto i = std::get_if<long long>(&v)) return std::to_string(*i);
    if (auto d = std::get_if<double>(&v)) {
        std::ostringstream os;
        os << *d;
        return os.str();
    }
    return std::get<std::string>(v);
}

} // namespace gaugelink

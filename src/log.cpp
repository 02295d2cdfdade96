// ============================================================================
// log.cpp - implementation for log.hpp
// ============================================================================

#include "gaugelink/log.hpp"

#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace gaugelink::log {

namespace {

std::atomic<uint8_t> g_level{static_cast<uint8_t>(Level::Warn)};
std::ostream* g_stream = nullptr;

std::mutex& out_mutex() {
    static std::mutex m;
    return m;
}

// Values with spaces or quotes are quoted so a line splits cleanly on ' '.
void put_value(std::ostream& os, const std::string& v) {
    bool plain = !v.empty();
    for (char c : v) {
        if (c == ' ' || c == '"' || c == '=' || c == '\t') { plain = false; break; }
    }
    if (plain) { os << v; return; }
    os << '"';
    for (char c : v) {
        if (c == '"' || c == '\\') os << '\\';
        os << c;
    }
    os << '"';
}

} // namespace

void set_level(Level lvl) { g_level.store(static_cast<uint8_t>(lvl)); }

Level level() { return static_cast<Level>(g_level.load()); }

bool enabled(Level lvl) { return static_cast<uint8_t>(lvl) <= g_level.load(); }

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Error: return "error";
        case Level::Warn:  return "warn";
        case Level::Info:  return "info";
        case Level::Debug: return "debug";
    }
    return "warn";
}

bool level_from_name(const std::string& name, Level& out) {
    std::string n;
    for (char c : name) n.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (n == "error")                     { out = Level::Error; return true; }
    if (n == "warn" || n == "warning")    { out = Level::Warn;  return true; }
    if (n == "info")                      { out = Level::Info;  return true; }
    if (n == "debug")                     { out = Level::Debug; return true; }
    return false;
}

void set_stream(std::ostream* os) {
    std::lock_guard<std::mutex> lock(out_mutex());
    g_stream = os;
}

void write(Level lvl, const std::string& event, const Fields& fields) {
    if (!enabled(lvl)) return;

    std::ostringstream line;
    line << "level=" << level_name(lvl) << " event=" << event;
    for (const auto& kv : fields) {
        line << ' ' << kv.first << '=';
        put_value(line, kv.second);
    }
    line << '\n';

    std::lock_guard<std::mutex> lock(out_mutex());
    std::ostream& os = g_stream ? *g_stream : std::cerr;
    os << line.str();
    os.flush();
}

} // namespace gaugelink::log

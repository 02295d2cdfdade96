#pragma once
/**
 * @file log.hpp
 * @brief Process-wide key=value diagnostics on stderr.
 *
 * @details
 * Lines look like the CLI's own status output so both can be grepped the
 * same way:
 *
 *   level=debug event=tx port=/dev/ttyUSB0 bytes="03 00 10 00 10"
 *   level=warn event=poll_stop_overrun grace_ms=500
 *
 * The level is global and defaults to warn. Calls are serialised with a
 * mutex because the polling worker logs concurrently with the caller.
 *
 * EXAMPLE
 * -------
 * @code
 *   gaugelink::log::set_level(gaugelink::log::Level::Debug);
 *   gaugelink::log::debug("tx", {{"port", path}, {"bytes", hex}});
 * @endcode
 */

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace gaugelink::log {

enum class Level : uint8_t { Error = 0, Warn, Info, Debug };

using Fields = std::vector<std::pair<std::string, std::string>>;

void set_level(Level lvl);
Level level();
bool enabled(Level lvl);

const char* level_name(Level lvl);

/// "error" | "warn" | "info" | "debug" (case-insensitive).
bool level_from_name(const std::string& name, Level& out);

/// Redirect output (tests). nullptr restores std::cerr.
void set_stream(std::ostream* os);

void write(Level lvl, const std::string& event, const Fields& fields = {});

inline void error(const std::string& event, const Fields& f = {}) { write(Level::Error, event, f); }
inline void warn(const std::string& event, const Fields& f = {})  { write(Level::Warn, event, f); }
inline void info(const std::string& event, const Fields& f = {})  { write(Level::Info, event, f); }
inline void debug(const std::string& event, const Fields& f = {}) { write(Level::Debug, event, f); }

} // namespace gaugelink::log

#include <doctest/doctest.h>
#include "gaugelink/log.hpp"

#include <sstream>

using namespace gaugelink;

namespace {

struct CapturedLog {
    std::ostringstream out;
    log::Level saved{log::level()};

    CapturedLog() { log::set_stream(&out); }
    ~CapturedLog() {
        log::set_stream(nullptr);
        log::set_level(saved);
    }
};

} // namespace

TEST_CASE("Lines are key=value with quoted values where needed") {
    CapturedLog cap;
    log::set_level(log::Level::Info);
    log::info("connected", {{"port", "/dev/ttyUSB0"}, {"reason", "no reply"}, {"empty", ""}});
    CHECK(cap.out.str() == "level=info event=connected port=/dev/ttyUSB0 reason=\"no reply\" empty=\"\"\n");
}

TEST_CASE("Levels above the threshold are dropped") {
    CapturedLog cap;
    log::set_level(log::Level::Warn);
    log::debug("tx");
    log::info("connected");
    log::warn("baud_discovery_failed");
    CHECK(cap.out.str() == "level=warn event=baud_discovery_failed\n");
    CHECK(log::enabled(log::Level::Error));
    CHECK_FALSE(log::enabled(log::Level::Debug));
}

TEST_CASE("Level names") {
    log::Level lvl = log::Level::Error;
    REQUIRE(log::level_from_name("WARNING", lvl));
    CHECK(lvl == log::Level::Warn);
    CHECK_FALSE(log::level_from_name("trace", lvl));
    CHECK(std::string(log::level_name(log::Level::Debug)) == "debug");
}

#include <catch2/catch_test_macros.hpp>

#include "clinic_voice/interrupt/barge_in.hpp"

using namespace clinic_voice::interrupt;
using namespace std::chrono_literals;

TEST_CASE("two words trigger a barge-in immediately") {
    BargeInDetector detector;
    const auto now = Clock::now();
    REQUIRE(detector.on_interim("hold on", now));
    REQUIRE(detector.state() == BargeInState::triggered);
}

TEST_CASE("a short single word waits for enough speech") {
    BargeInDetector detector;
    const auto start = Clock::now();
    REQUIRE_FALSE(detector.on_interim("uh", start));
    REQUIRE(detector.state() == BargeInState::listening);
    REQUIRE_FALSE(detector.on_interim("uh", start + 100ms));
    REQUIRE(detector.on_interim("uh", start + 200ms));
}

TEST_CASE("a long single word triggers on characters") {
    BargeInDetector detector;
    REQUIRE(detector.on_interim("excuse", Clock::now()));
}

TEST_CASE("blank interims are ignored") {
    BargeInDetector detector;
    REQUIRE_FALSE(detector.on_interim("   ", Clock::now()));
    REQUIRE(detector.state() == BargeInState::idle);
}

TEST_CASE("cooldown suppresses repeated triggers") {
    BargeInDetector detector;
    const auto start = Clock::now();
    REQUIRE(detector.on_interim("wait a second", start));
    REQUIRE_FALSE(detector.on_interim("wait a second please", start + 200ms));
    REQUIRE(detector.state() == BargeInState::triggered);
    REQUIRE(detector.on_interim("wait a second please stop", start + 700ms));
}

TEST_CASE("a final transcript resets the detector") {
    BargeInDetector detector;
    const auto start = Clock::now();
    REQUIRE(detector.on_interim("hold on", start));
    detector.on_final();
    REQUIRE(detector.state() == BargeInState::idle);
    REQUIRE_FALSE(detector.on_interim("uh", start + 600ms));
    REQUIRE(detector.state() == BargeInState::listening);
}

TEST_CASE("reset clears the cooldown of an earlier trigger") {
    BargeInDetector detector;
    const auto start = Clock::now();
    REQUIRE(detector.on_interim("what are your", start));
    detector.reset();
    REQUIRE(detector.state() == BargeInState::idle);
    REQUIRE(detector.on_interim("no wait", start + 100ms));
}

TEST_CASE("thresholds come from configuration") {
    clinic_voice::Config config;
    config.barge_in_min_words = 3;
    config.barge_in_min_chars = 50;
    config.barge_in_min_speech_ms = 1000;
    BargeInDetector detector(BargeInThresholds::from_config(config));
    REQUIRE_FALSE(detector.on_interim("hold on", Clock::now()));
    REQUIRE(detector.on_interim("hold on now", Clock::now()));
}

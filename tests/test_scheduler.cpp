#include <catch2/catch_test_macros.hpp>

#include "clinic_voice/playback/scheduler.hpp"

#include "fakes.hpp"

using namespace clinic_voice;
using namespace std::chrono_literals;
using testing::RecordingSink;

namespace {

playback::SchedulerOptions fast_options() {
    playback::SchedulerOptions options;
    options.chunk_ms = 20;
    options.lead_chunks = 3;
    options.high_water = 25;
    options.short_utterance_ms = 500;
    options.prebuffer_ms = 40;
    return options;
}

std::vector<uint8_t> bytes_of(size_t count) {
    return std::vector<uint8_t>(count, 0x7F);
}

}

TEST_CASE("chunks are sized to the configured duration") {
    auto sink = std::make_shared<RecordingSink>();
    playback::PlaybackScheduler scheduler(sink, fast_options(), "s-1");
    REQUIRE(scheduler.chunk_bytes() == 160);

    REQUIRE(scheduler.append(1, 1, bytes_of(400)));
    scheduler.finish(1, 1);
    REQUIRE(testing::eventually([&]() { return sink->count(RecordingSink::Kind::mark) == 1; }));

    std::vector<size_t> sizes;
    for (const auto& event : sink->events()) {
        if (event.kind == RecordingSink::Kind::audio) {
            sizes.push_back(event.bytes);
        }
    }
    REQUIRE(sizes == std::vector<size_t>{160, 160, 80});
    REQUIRE(sink->marks() == std::vector<std::string>{"turn-1-utterance-1"});
}

TEST_CASE("lead chunks go out together and the rest are paced") {
    auto sink = std::make_shared<RecordingSink>();
    playback::PlaybackScheduler scheduler(sink, fast_options(), "s-1");
    REQUIRE(scheduler.append(1, 1, bytes_of(160 * 10)));
    scheduler.finish(1, 1);
    REQUIRE(testing::eventually([&]() { return sink->count(RecordingSink::Kind::mark) == 1; }));

    std::vector<testing::SteadyClock::time_point> sent;
    for (const auto& event : sink->events()) {
        if (event.kind == RecordingSink::Kind::audio) {
            sent.push_back(event.at);
        }
    }
    REQUIRE(sent.size() == 10);
    // Seven paced chunks follow the three lead chunks.
    REQUIRE(sent.back() - sent.front() >= 7 * 20ms - 5ms);
    REQUIRE(sent[3] - sent[2] >= 15ms);
}

TEST_CASE("short utterances wait for the prebuffer before starting") {
    auto sink = std::make_shared<RecordingSink>();
    playback::PlaybackScheduler scheduler(sink, fast_options(), "s-1");
    const auto appended = testing::SteadyClock::now();
    REQUIRE(scheduler.append(1, 1, bytes_of(320)));
    scheduler.finish(1, 1);
    REQUIRE(testing::eventually([&]() { return sink->count(RecordingSink::Kind::audio) >= 1; }));
    REQUIRE(sink->events().front().at - appended >= 35ms);
}

TEST_CASE("utterances play in order with a mark after each") {
    auto sink = std::make_shared<RecordingSink>();
    playback::PlaybackScheduler scheduler(sink, fast_options(), "s-1");
    REQUIRE(scheduler.append(1, 1, bytes_of(4000)));
    REQUIRE(scheduler.append(1, 2, bytes_of(4000)));
    scheduler.finish(1, 2);
    scheduler.finish(1, 1);
    REQUIRE(testing::eventually([&]() { return sink->count(RecordingSink::Kind::mark) == 2; },
                                5000ms));
    REQUIRE(sink->marks() ==
            std::vector<std::string>{"turn-1-utterance-1", "turn-1-utterance-2"});
}

TEST_CASE("cancelling a turn stops its audio and clears the carrier") {
    auto sink = std::make_shared<RecordingSink>();
    playback::PlaybackScheduler scheduler(sink, fast_options(), "s-1");
    REQUIRE(scheduler.append(1, 1, bytes_of(8000)));
    REQUIRE(testing::eventually([&]() { return sink->count(RecordingSink::Kind::audio) >= 5; }));
    REQUIRE(scheduler.is_playing());

    scheduler.cancel_through(1);
    std::this_thread::sleep_for(100ms);

    const auto events = sink->events();
    bool cleared = false;
    for (const auto& event : events) {
        if (event.kind == RecordingSink::Kind::clear) {
            cleared = true;
        } else if (cleared) {
            FAIL("carrier received output after the clear");
        }
    }
    REQUIRE(cleared);
    REQUIRE(sink->count(RecordingSink::Kind::audio) < 50);
    REQUIRE(scheduler.cleared_through() == std::optional<uint64_t>(1));
    REQUIRE_FALSE(scheduler.append(1, 2, bytes_of(160)));
    REQUIRE(scheduler.append(2, 3, bytes_of(800)));
}

TEST_CASE("audio after an utterance end is rejected") {
    auto sink = std::make_shared<RecordingSink>();
    playback::PlaybackScheduler scheduler(sink, fast_options(), "s-1");
    REQUIRE(scheduler.append(1, 1, bytes_of(8000)));
    scheduler.finish(1, 1);
    REQUIRE_FALSE(scheduler.append(1, 1, bytes_of(160)));
}

TEST_CASE("backpressure slows sending when the carrier is far ahead") {
    auto options = fast_options();
    options.lead_chunks = 6;
    options.high_water = 2;
    auto sink = std::make_shared<RecordingSink>();
    playback::PlaybackScheduler scheduler(sink, options, "s-1");
    REQUIRE(scheduler.append(1, 1, bytes_of(160 * 8)));
    scheduler.finish(1, 1);
    REQUIRE(testing::eventually([&]() { return scheduler.in_flight() >= 4; }));
    REQUIRE(testing::eventually([&]() { return sink->count(RecordingSink::Kind::mark) == 1; }));

    std::vector<testing::SteadyClock::time_point> sent;
    for (const auto& event : sink->events()) {
        if (event.kind == RecordingSink::Kind::audio) {
            sent.push_back(event.at);
        }
    }
    REQUIRE(sent.size() == 8);
    // Six chunks in flight against a high water mark of two gives a 3x interval.
    REQUIRE(sent[6] - sent[5] >= 55ms);
}

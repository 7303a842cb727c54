#include <catch2/catch_test_macros.hpp>

#include "clinic_voice/carrier/media_stream.hpp"

#include <string>
#include <vector>

using namespace clinic_voice;
using carrier::StreamEventType;

TEST_CASE("start events carry the call and stream ids") {
    const auto event = carrier::parse_stream_event(
        R"({"event":"start","sequenceNumber":"1",)"
        R"("start":{"streamSid":"MZ1","callSid":"CA1","tracks":["inbound"]},"streamSid":"MZ1"})");
    REQUIRE(event.has_value());
    REQUIRE(event->type == StreamEventType::start);
    REQUIRE(event->stream_sid == "MZ1");
    REQUIRE(event->call_sid == "CA1");
}

TEST_CASE("media, mark and stop events are recognised") {
    const auto media = carrier::parse_stream_event(
        R"({"event":"media","streamSid":"MZ1","media":{"track":"inbound","payload":"/38A"}})");
    REQUIRE(media.has_value());
    REQUIRE(media->type == StreamEventType::media);
    REQUIRE(media->payload == "/38A");

    const auto mark = carrier::parse_stream_event(
        R"({"event":"mark","streamSid":"MZ1","mark":{"name":"turn-2-utterance-4"}})");
    REQUIRE(mark.has_value());
    REQUIRE(mark->type == StreamEventType::mark);
    REQUIRE(mark->payload == "turn-2-utterance-4");

    const auto stop = carrier::parse_stream_event(
        R"({"event":"stop","streamSid":"MZ1","stop":{"callSid":"CA1"}})");
    REQUIRE(stop.has_value());
    REQUIRE(stop->type == StreamEventType::stop);
    REQUIRE(stop->call_sid == "CA1");

    const auto connected = carrier::parse_stream_event(R"({"event":"connected","protocol":"Call"})");
    REQUIRE(connected.has_value());
    REQUIRE(connected->type == StreamEventType::connected);
}

TEST_CASE("malformed frames are rejected and unknown events flagged") {
    REQUIRE_FALSE(carrier::parse_stream_event("not json").has_value());
    REQUIRE_FALSE(carrier::parse_stream_event("[1,2]").has_value());

    const auto odd = carrier::parse_stream_event(R"({"event":"dtmf","streamSid":"MZ1"})");
    REQUIRE(odd.has_value());
    REQUIRE(odd->type == StreamEventType::unknown);

    const auto bare = carrier::parse_stream_event(R"({"event":"media","streamSid":"MZ1"})");
    REQUIRE(bare.has_value());
    REQUIRE(bare->payload.empty());
}

TEST_CASE("outbound events use the media stream wire format") {
    const auto media = carrier::make_media_event("MZ1", {0xFF, 0x7F, 0x00});
    REQUIRE(media["event"] == "media");
    REQUIRE(media["streamSid"] == "MZ1");
    REQUIRE(media["media"]["payload"] == "/38A");

    const auto clear = carrier::make_clear_event("MZ1");
    REQUIRE(clear == nlohmann::json{{"event", "clear"}, {"streamSid", "MZ1"}});

    const auto mark = carrier::make_mark_event("MZ1", "turn-1-utterance-1");
    REQUIRE(mark["event"] == "mark");
    REQUIRE(mark["mark"]["name"] == "turn-1-utterance-1");
}

TEST_CASE("twiml connects the call to the stream url") {
    const auto twiml = carrier::build_twiml("wss://voice.example.com/media?a=1&b=2");
    REQUIRE(twiml ==
            "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
            "<Response><Connect>"
            "<Stream url=\"wss://voice.example.com/media?a=1&amp;b=2\"/>"
            "</Connect><Pause length=\"600\"/></Response>");
}

TEST_CASE("stream url prefers the advertised address") {
    REQUIRE(carrier::resolve_stream_url(std::string("wss://public.example.com/stream"),
                                        "10.0.0.5:8081") == "wss://public.example.com/stream");
    REQUIRE(carrier::resolve_stream_url(std::nullopt, "localhost:8081") == "ws://localhost:8081");
    REQUIRE(carrier::resolve_stream_url(std::nullopt, "127.0.0.1:8081") == "ws://127.0.0.1:8081");
    REQUIRE(carrier::resolve_stream_url(std::string(), "abc.ngrok.io") == "wss://abc.ngrok.io");
}

TEST_CASE("media stream sink forwards events until detached") {
    std::vector<std::string> sent;
    carrier::MediaStreamSink sink("MZ9", [&](const std::string& text) {
        sent.push_back(text);
        return true;
    });

    sink.send_audio({0x7F, 0x7F});
    sink.send_mark("turn-1-utterance-1");
    sink.send_clear();
    REQUIRE(sent.size() == 3);
    REQUIRE(nlohmann::json::parse(sent[0])["event"] == "media");
    REQUIRE(nlohmann::json::parse(sent[0])["streamSid"] == "MZ9");
    REQUIRE(nlohmann::json::parse(sent[1])["mark"]["name"] == "turn-1-utterance-1");
    REQUIRE(nlohmann::json::parse(sent[2])["event"] == "clear");

    sink.detach();
    sink.send_audio({0x7F});
    sink.send_clear();
    REQUIRE(sent.size() == 3);
}

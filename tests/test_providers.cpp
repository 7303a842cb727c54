#include <catch2/catch_test_macros.hpp>

#include "clinic_voice/errors.hpp"
#include "clinic_voice/providers/chat.hpp"
#include "clinic_voice/providers/deepgram.hpp"
#include "clinic_voice/providers/elevenlabs.hpp"
#include "clinic_voice/providers/http_client.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace clinic_voice;

TEST_CASE("completion events yield their text deltas") {
    bool done = false;
    const auto fragment = providers::parse_openai_event(
        R"(data: {"id":"c1","choices":[{"index":0,"delta":{"content":"Hello"}}]})", done);
    REQUIRE(fragment == std::optional<std::string>("Hello"));
    REQUIRE_FALSE(done);

    const auto role_only = providers::parse_openai_event(
        R"(data: {"choices":[{"index":0,"delta":{"role":"assistant"}}]})", done);
    REQUIRE_FALSE(role_only.has_value());

    REQUIRE_FALSE(providers::parse_openai_event("", done).has_value());
    REQUIRE_FALSE(providers::parse_openai_event(": keep-alive", done).has_value());
    REQUIRE_FALSE(done);

    REQUIRE_FALSE(providers::parse_openai_event("data: [DONE]", done).has_value());
    REQUIRE(done);
}

TEST_CASE("completion stream errors raise provider errors") {
    bool done = false;
    REQUIRE_THROWS_AS(
        providers::parse_openai_event(R"(data: {"error":{"message":"rate limited"}})", done),
        ProviderError);
    REQUIRE_THROWS_AS(providers::parse_ollama_line(R"({"error":"model not found"})", done),
                      ProviderError);
}

TEST_CASE("ollama lines yield content and signal completion") {
    bool done = false;
    const auto fragment = providers::parse_ollama_line(
        R"({"model":"llama3","message":{"role":"assistant","content":"We open"},"done":false})",
        done);
    REQUIRE(fragment == std::optional<std::string>("We open"));
    REQUIRE_FALSE(done);

    const auto last = providers::parse_ollama_line(
        R"({"model":"llama3","message":{"role":"assistant","content":""},"done":true})", done);
    REQUIRE(last == std::optional<std::string>(""));
    REQUIRE(done);

    REQUIRE_FALSE(providers::parse_ollama_line("   ", done).has_value());
}

TEST_CASE("line buffer splits chunks across boundaries") {
    providers::LineBuffer buffer;
    std::vector<std::string> lines;
    const auto collect = [&](const std::string& line) {
        lines.push_back(line);
        return true;
    };
    const std::string first = "data: one\r\ndata: t";
    const std::string second = "wo\ndata: thr";
    REQUIRE(buffer.feed(first.data(), first.size(), collect));
    REQUIRE(buffer.feed(second.data(), second.size(), collect));
    REQUIRE(lines == std::vector<std::string>{"data: one", "data: two"});
    REQUIRE(buffer.take_rest() == "data: thr");
    REQUIRE(buffer.take_rest().empty());
}

TEST_CASE("line buffer stops when the handler declines") {
    providers::LineBuffer buffer;
    int seen = 0;
    const std::string chunk = "a\nb\nc\n";
    const bool more = buffer.feed(chunk.data(), chunk.size(), [&](const std::string&) {
        return ++seen < 2;
    });
    REQUIRE_FALSE(more);
    REQUIRE(seen == 2);
    REQUIRE(buffer.take_rest() == "c\n");
}

TEST_CASE("chat messages serialise with role and content") {
    const auto json = providers::to_json_messages(
        {{"system", "You are helpful."}, {"user", "hi"}});
    REQUIRE(json == nlohmann::json::array({{{"role", "system"}, {"content", "You are helpful."}},
                                           {{"role", "user"}, {"content", "hi"}}}));
}

TEST_CASE("recognizer results expose transcript and finality") {
    const auto message = nlohmann::json::parse(R"({
        "type": "Results",
        "is_final": true,
        "speech_final": false,
        "channel": {"alternatives": [{"transcript": "what are your hours", "confidence": 0.98}]}
    })");
    const auto result = providers::parse_transcript_message(message);
    REQUIRE(result.has_value());
    REQUIRE(result->text == "what are your hours");
    REQUIRE(result->is_final);
    REQUIRE_FALSE(result->speech_final);

    REQUIRE_FALSE(providers::parse_transcript_message(
                      nlohmann::json{{"type", "Metadata"}, {"request_id", "r1"}})
                      .has_value());

    const auto empty = providers::parse_transcript_message(
        nlohmann::json{{"type", "Results"}, {"channel", {{"alternatives", nlohmann::json::array()}}}});
    REQUIRE(empty.has_value());
    REQUIRE(empty->text.empty());
    REQUIRE_FALSE(empty->is_final);
}

TEST_CASE("listen url carries the stream parameters") {
    providers::RecognizerSettings settings;
    settings.url = "wss://api.deepgram.com/v1/listen";
    settings.model = "nova-2";
    settings.sample_rate = 8000;
    REQUIRE(providers::build_listen_url(settings) ==
            "wss://api.deepgram.com/v1/listen?channels=1&encoding=linear16"
            "&interim_results=true&model=nova-2&punctuate=true&sample_rate=8000"
            "&smart_format=true");
}

TEST_CASE("synthesizer url targets the voice stream input") {
    providers::SynthesizerSettings settings;
    settings.url = "wss://api.elevenlabs.io/v1/text-to-speech";
    settings.voice_id = "VOICE";
    settings.model = "eleven_turbo_v2_5";
    REQUIRE(providers::build_stream_input_url(settings) ==
            "wss://api.elevenlabs.io/v1/text-to-speech/VOICE/stream-input"
            "?model_id=eleven_turbo_v2_5&output_format=ulaw_8000");
}

TEST_CASE("synthesis sends settings, text and end of input") {
    providers::SynthesizerSettings settings;
    settings.api_key = "xi-key";
    settings.stability = 0.4;
    settings.similarity_boost = 0.8;
    const auto messages = providers::build_synthesis_messages(settings, "We open at nine.");
    REQUIRE(messages.size() == 3);
    REQUIRE(messages[0]["xi_api_key"] == "xi-key");
    REQUIRE(messages[0]["voice_settings"]["stability"] == 0.4);
    REQUIRE(messages[0]["voice_settings"]["similarity_boost"] == 0.8);
    REQUIRE(messages[0]["voice_settings"]["use_speaker_boost"] == true);
    REQUIRE(messages[1]["text"] == "We open at nine.");
    REQUIRE(messages[1]["flush"] == true);
    REQUIRE(messages[2] == nlohmann::json{{"text", ""}});
}

TEST_CASE("provider settings follow the configuration") {
    Config config;
    config.stt_api_key = "dg";
    config.stt_model = "nova-2-phonecall";
    config.tts_voice_id = "voice-1";
    config.tts_timeout_sec = 12.0;
    const auto recognizer = providers::RecognizerSettings::from_config(config);
    REQUIRE(recognizer.api_key == "dg");
    REQUIRE(recognizer.model == "nova-2-phonecall");
    REQUIRE(recognizer.sample_rate == 8000);
    const auto synthesizer = providers::SynthesizerSettings::from_config(config);
    REQUIRE(synthesizer.voice_id == "voice-1");
    REQUIRE(synthesizer.timeout_sec == 12.0);
}

TEST_CASE("request options apply one budget to every phase") {
    const auto options = providers::RequestOptions::uniform(2.5);
    REQUIRE(options.connect_timeout == std::chrono::milliseconds(2500));
    REQUIRE(options.read_timeout == std::chrono::milliseconds(2500));
    REQUIRE(options.write_timeout == std::chrono::milliseconds(2500));
    REQUIRE(options.total_timeout == std::chrono::milliseconds(2500));
}

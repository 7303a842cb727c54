#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace clinic_voice {

std::string default_system_prompt();
std::vector<std::string> default_rag_keywords();

struct Config {
    // Carrier media stream (webhook + websocket share one listener).
    std::string carrier_host = "0.0.0.0";
    int carrier_port = 8081;
    std::optional<std::string> public_stream_url;
    int carrier_sample_rate = 8000;
    double inbound_gain = 4.0;

    int rest_api_port = 8000;
    std::optional<std::string> authorization_token;

    // Speech to text.
    std::string stt_api_key;
    std::string stt_url = "wss://api.deepgram.com/v1/listen";
    std::string stt_model = "nova-2";
    int stt_sample_rate = 8000;
    double stt_connect_timeout_sec = 10.0;

    // Text to speech.
    std::string tts_api_key;
    std::string tts_voice_id;
    std::string tts_url = "wss://api.elevenlabs.io/v1/text-to-speech";
    std::string tts_model = "eleven_turbo_v2_5";
    double tts_timeout_sec = 30.0;
    double tts_stability = 0.5;
    double tts_similarity_boost = 0.75;

    // Reply generation.
    std::string llm_provider = "openai";
    std::string llm_base_url = "https://api.openai.com";
    std::optional<std::string> llm_api_key;
    std::string llm_model = "gpt-4o-mini";
    double llm_temperature = 0.7;
    int llm_max_tokens = 150;
    double llm_timeout_sec = 30.0;
    std::string system_prompt = default_system_prompt();
    int history_max_messages = 20;

    // Knowledge base.
    std::optional<std::filesystem::path> kb_index_path;
    std::string embedding_base_url = "https://api.openai.com";
    std::optional<std::string> embedding_api_key;
    std::string embedding_model = "text-embedding-3-small";
    double embedding_timeout_sec = 5.0;
    int rag_top_k = 3;
    double rag_min_score = 0.5;
    double rag_mid_score = 0.6;
    double rag_high_score = 0.8;
    std::vector<std::string> rag_keywords = default_rag_keywords();

    // Playback.
    int playback_chunk_ms = 20;
    int playback_lead_chunks = 3;
    int playback_high_water = 25;
    int playback_short_utterance_ms = 500;
    int playback_prebuffer_ms = 40;

    // Barge-in.
    bool interruptions_are_allowed = true;
    int barge_in_min_words = 2;
    int barge_in_min_speech_ms = 150;
    int barge_in_min_chars = 5;
    int barge_in_cooldown_ms = 500;

    std::string greeting_text;
    double greeting_delay_sec = 0.0;
    std::string apology_text = "I'm sorry, I encountered an error processing your request.";

    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "clinic_voice";

    static Config load();
    void validate() const;
};

}

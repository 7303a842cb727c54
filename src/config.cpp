#include "clinic_voice/config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace clinic_voice {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string get_env_required(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw std::runtime_error(std::string(name) + " is required");
    }
    return std::string(value);
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true" || normalized == "1" || normalized == "yes";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    return value ? std::stoi(value) : fallback;
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    return value ? std::stod(value) : fallback;
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::vector<std::string> split_csv(const std::string& raw) {
    std::vector<std::string> result;
    std::stringstream stream(raw);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

// Accepts either a JSON array of strings or a comma separated list.
std::vector<std::string> parse_keywords(const std::string& raw,
                                        const std::vector<std::string>& fallback) {
    const auto trimmed = trim(raw);
    if (trimmed.empty()) {
        return fallback;
    }
    if (trimmed.front() != '[') {
        return split_csv(trimmed);
    }
    auto json = nlohmann::json::parse(trimmed);
    if (!json.is_array()) {
        throw std::runtime_error("RAG_KEYWORDS must be a JSON array");
    }
    std::vector<std::string> result;
    for (const auto& item : json) {
        result.push_back(item.get<std::string>());
    }
    return result;
}

std::string read_text_file(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        throw std::runtime_error("Cannot read " + path.string());
    }
    std::ostringstream out;
    out << stream.rdbuf();
    return out.str();
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        // Variables already set in the process environment win over .env.
        setenv(key.c_str(), strip_quotes(value).c_str(), 0);
    }
}

}

std::string default_system_prompt() {
    return "You are the virtual front desk assistant for Northview Pain Management Center. "
           "You answer phone calls from patients and callers.\n\n"
           "Speak naturally and keep answers to one to three short sentences unless the caller "
           "asks for more detail. Be warm, professional and patient-centered.\n\n"
           "Only answer using information from the provided context. If the context does not "
           "contain the answer, say that you don't have that specific information and offer to "
           "connect the caller with the team. Never invent information. For scheduling, urgent "
           "medical concerns or detailed questions, direct callers to the office at "
           "(555) 123-4567.";
}

std::vector<std::string> default_rag_keywords() {
    return {"pain", "appointment", "schedule", "doctor", "treatment", "insurance",
            "accept", "coverage", "copay", "blue cross", "aetna", "cigna", "medicare",
            "medicaid", "service", "therapy", "medication", "procedure", "clinic", "center",
            "provider", "physician", "hours", "open", "location", "address", "parking",
            "cost", "billing", "injection", "physical therapy", "back", "neck", "chronic",
            "acute", "referral", "refill", "northview"};
}

Config Config::load() {
    load_dotenv();
    Config config;

    config.carrier_host = get_env_str("CARRIER_HOST", "0.0.0.0");
    config.carrier_port = get_env_int("CARRIER_PORT", 8081);
    config.public_stream_url = get_env_optional("PUBLIC_STREAM_URL");
    config.inbound_gain = get_env_double("INBOUND_GAIN", 4.0);
    config.rest_api_port = get_env_int("REST_API_PORT", 8000);
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");

    config.stt_api_key = get_env_required("DEEPGRAM_API_KEY");
    config.stt_url = get_env_str("STT_URL", config.stt_url);
    config.stt_model = get_env_str("STT_MODEL", config.stt_model);
    config.stt_sample_rate = get_env_int("STT_SAMPLE_RATE", 8000);
    config.stt_connect_timeout_sec = get_env_double("STT_CONNECT_TIMEOUT_SEC", 10.0);

    config.tts_api_key = get_env_required("ELEVENLABS_API_KEY");
    config.tts_voice_id = get_env_required("ELEVENLABS_VOICE_ID");
    config.tts_url = get_env_str("TTS_URL", config.tts_url);
    config.tts_model = get_env_str("TTS_MODEL", config.tts_model);
    config.tts_timeout_sec = get_env_double("TTS_TIMEOUT_SEC", 30.0);
    config.tts_stability = get_env_double("TTS_STABILITY", 0.5);
    config.tts_similarity_boost = get_env_double("TTS_SIMILARITY_BOOST", 0.75);

    config.llm_provider = get_env_str("LLM_PROVIDER", "openai");
    const std::string default_llm_url =
        config.llm_provider == "ollama" ? "http://localhost:11434" : "https://api.openai.com";
    config.llm_base_url = get_env_str("LLM_BASE_URL", default_llm_url);
    config.llm_api_key = get_env_optional("OPENAI_API_KEY");
    config.llm_model = get_env_str(
        "LLM_MODEL", config.llm_provider == "ollama" ? "qwen2.5:0.5b" : "gpt-4o-mini");
    config.llm_temperature = get_env_double("LLM_TEMPERATURE", 0.7);
    config.llm_max_tokens = get_env_int("LLM_MAX_TOKENS", 150);
    config.llm_timeout_sec = get_env_double("LLM_TIMEOUT_SEC", 30.0);
    if (const auto prompt_file = get_env_optional("SYSTEM_PROMPT_FILE")) {
        config.system_prompt = trim(read_text_file(*prompt_file));
    } else {
        config.system_prompt = get_env_str("SYSTEM_PROMPT", default_system_prompt());
    }
    config.history_max_messages = get_env_int("HISTORY_MAX_MESSAGES", 20);

    if (const auto index_path = get_env_optional("KB_INDEX_PATH")) {
        config.kb_index_path = std::filesystem::path(*index_path);
    }
    config.embedding_base_url = get_env_str("EMBEDDING_BASE_URL", config.llm_base_url);
    config.embedding_api_key = get_env_optional("EMBEDDING_API_KEY");
    if (!config.embedding_api_key) {
        config.embedding_api_key = config.llm_api_key;
    }
    config.embedding_model = get_env_str("EMBEDDING_MODEL", config.embedding_model);
    config.embedding_timeout_sec = get_env_double("EMBEDDING_TIMEOUT_SEC", 5.0);
    config.rag_top_k = get_env_int("RAG_TOP_K", 3);
    config.rag_min_score = get_env_double("RAG_MIN_SCORE", 0.5);
    config.rag_mid_score = get_env_double("RAG_MID_SCORE", 0.6);
    config.rag_high_score = get_env_double("RAG_HIGH_SCORE", 0.8);
    config.rag_keywords = parse_keywords(get_env_str("RAG_KEYWORDS", ""), default_rag_keywords());

    config.playback_chunk_ms = get_env_int("PLAYBACK_CHUNK_MS", 20);
    config.playback_lead_chunks = get_env_int("PLAYBACK_LEAD_CHUNKS", 3);
    config.playback_high_water = get_env_int("PLAYBACK_HIGH_WATER", 25);
    config.playback_short_utterance_ms = get_env_int("PLAYBACK_SHORT_UTTERANCE_MS", 500);
    config.playback_prebuffer_ms = get_env_int("PLAYBACK_PREBUFFER_MS", 40);

    config.interruptions_are_allowed = get_env_bool("INTERRUPTIONS_ARE_ALLOWED", true);
    config.barge_in_min_words = get_env_int("BARGE_IN_MIN_WORDS", 2);
    config.barge_in_min_speech_ms = get_env_int("BARGE_IN_MIN_SPEECH_MS", 150);
    config.barge_in_min_chars = get_env_int("BARGE_IN_MIN_CHARS", 5);
    config.barge_in_cooldown_ms = get_env_int("BARGE_IN_COOLDOWN_MS", 500);

    config.greeting_text = get_env_str("GREETING_TEXT", "Hello! How can I help you today?");
    config.greeting_delay_sec = get_env_double("GREETING_DELAY_SEC", 0.0);
    config.apology_text = get_env_str("APOLOGY_TEXT", config.apology_text);

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "clinic_voice");

    return config;
}

void Config::validate() const {
    if (carrier_port <= 0) {
        throw std::runtime_error("CARRIER_PORT must be positive");
    }
    if (rest_api_port <= 0) {
        throw std::runtime_error("REST_API_PORT must be positive");
    }
    if (rest_api_port == carrier_port) {
        throw std::runtime_error("REST_API_PORT and CARRIER_PORT must differ");
    }
    if (carrier_sample_rate != 8000) {
        throw std::runtime_error("carrier sample rate must be 8000");
    }
    if (stt_sample_rate != 8000 && stt_sample_rate != 16000) {
        throw std::runtime_error("STT_SAMPLE_RATE must be 8000 or 16000");
    }
    if (inbound_gain <= 0.0) {
        throw std::runtime_error("INBOUND_GAIN must be positive");
    }
    if (llm_provider != "openai" && llm_provider != "ollama") {
        throw std::runtime_error("LLM_PROVIDER must be openai or ollama");
    }
    if (llm_provider == "openai" && !llm_api_key) {
        throw std::runtime_error("OPENAI_API_KEY is required for the openai provider");
    }
    if (llm_max_tokens <= 0) {
        throw std::runtime_error("LLM_MAX_TOKENS must be positive");
    }
    if (llm_timeout_sec <= 0.0 || tts_timeout_sec <= 0.0 || stt_connect_timeout_sec <= 0.0 ||
        embedding_timeout_sec <= 0.0) {
        throw std::runtime_error("provider timeouts must be positive");
    }
    if (history_max_messages < 3) {
        throw std::runtime_error("HISTORY_MAX_MESSAGES must be at least 3");
    }
    if (rag_top_k <= 0) {
        throw std::runtime_error("RAG_TOP_K must be positive");
    }
    if (rag_min_score < 0.0 || rag_high_score > 1.0 ||
        rag_min_score > rag_mid_score || rag_mid_score > rag_high_score) {
        throw std::runtime_error(
            "RAG thresholds must satisfy 0 <= RAG_MIN_SCORE <= RAG_MID_SCORE <= RAG_HIGH_SCORE <= 1");
    }
    if (playback_chunk_ms < 15 || playback_chunk_ms > 40) {
        throw std::runtime_error("PLAYBACK_CHUNK_MS must be between 15 and 40");
    }
    if (playback_lead_chunks < 0 || playback_high_water <= 0) {
        throw std::runtime_error("PLAYBACK_LEAD_CHUNKS must be >= 0 and PLAYBACK_HIGH_WATER > 0");
    }
    if (playback_short_utterance_ms < 0 || playback_prebuffer_ms < 0) {
        throw std::runtime_error("playback buffering settings must not be negative");
    }
    if (barge_in_min_words <= 0 || barge_in_min_chars <= 0 || barge_in_min_speech_ms < 0 ||
        barge_in_cooldown_ms < 0) {
        throw std::runtime_error("barge-in thresholds must be positive");
    }
    if (apology_text.empty()) {
        throw std::runtime_error("APOLOGY_TEXT must not be empty");
    }
}

}

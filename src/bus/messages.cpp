#include "clinic_voice/bus/messages.hpp"

#include <chrono>

namespace clinic_voice::bus {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

void to_json(nlohmann::json& j, const TranscriptEvent& value) {
    j = nlohmann::json{{"session_id", value.session_id},
                       {"text", value.text},
                       {"is_final", value.is_final},
                       {"speech_final", value.speech_final},
                       {"timestamp", value.timestamp_ms}};
}

void from_json(const nlohmann::json& j, TranscriptEvent& value) {
    value.session_id = j.at("session_id").get<std::string>();
    value.text = j.value("text", "");
    value.is_final = j.value("is_final", false);
    value.speech_final = j.value("speech_final", false);
    value.timestamp_ms = j.value("timestamp", int64_t{0});
}

void to_json(nlohmann::json& j, const GenerationRequest& value) {
    j = nlohmann::json{{"session_id", value.session_id},
                       {"turn_id", value.turn_id},
                       {"transcript", value.transcript}};
}

void from_json(const nlohmann::json& j, GenerationRequest& value) {
    value.session_id = j.at("session_id").get<std::string>();
    value.turn_id = j.at("turn_id").get<uint64_t>();
    value.transcript = j.at("transcript").get<std::string>();
}

void to_json(nlohmann::json& j, const SynthesisRequest& value) {
    j = nlohmann::json{{"session_id", value.session_id},
                       {"turn_id", value.turn_id},
                       {"utterance_id", value.utterance_id},
                       {"text", value.text}};
}

void from_json(const nlohmann::json& j, SynthesisRequest& value) {
    value.session_id = j.at("session_id").get<std::string>();
    value.turn_id = j.at("turn_id").get<uint64_t>();
    value.utterance_id = j.at("utterance_id").get<uint64_t>();
    value.text = j.at("text").get<std::string>();
}

void to_json(nlohmann::json& j, const AudioChunk& value) {
    j = nlohmann::json{{"session_id", value.session_id},
                       {"turn_id", value.turn_id},
                       {"utterance_id", value.utterance_id},
                       {"payload", value.payload},
                       {"end", value.end}};
}

void from_json(const nlohmann::json& j, AudioChunk& value) {
    value.session_id = j.at("session_id").get<std::string>();
    value.turn_id = j.at("turn_id").get<uint64_t>();
    value.utterance_id = j.at("utterance_id").get<uint64_t>();
    value.payload = j.value("payload", "");
    value.end = j.value("end", false);
}

void to_json(nlohmann::json& j, const ClearSignal& value) {
    j = nlohmann::json{{"session_id", value.session_id},
                       {"turn_id", value.turn_id},
                       {"reason", value.reason},
                       {"timestamp", now_ms()}};
}

void from_json(const nlohmann::json& j, ClearSignal& value) {
    value.session_id = j.at("session_id").get<std::string>();
    value.turn_id = j.at("turn_id").get<uint64_t>();
    value.reason = j.value("reason", "");
}

}

#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace clinic_voice {
namespace bus {

struct TranscriptEvent {
    std::string session_id;
    std::string text;
    bool is_final = false;
    bool speech_final = false;
    int64_t timestamp_ms = 0;
};

struct GenerationRequest {
    std::string session_id;
    uint64_t turn_id = 0;
    std::string transcript;
};

struct SynthesisRequest {
    std::string session_id;
    uint64_t turn_id = 0;
    uint64_t utterance_id = 0;
    std::string text;
};

// One slice of synthesized carrier audio, or the end marker of an utterance
// when `end` is set (payload is then empty).
struct AudioChunk {
    std::string session_id;
    uint64_t turn_id = 0;
    uint64_t utterance_id = 0;
    std::string payload;
    bool end = false;
};

struct ClearSignal {
    std::string session_id;
    uint64_t turn_id = 0;
    std::string reason;
};

int64_t now_ms();

void to_json(nlohmann::json& j, const TranscriptEvent& value);
void from_json(const nlohmann::json& j, TranscriptEvent& value);
void to_json(nlohmann::json& j, const GenerationRequest& value);
void from_json(const nlohmann::json& j, GenerationRequest& value);
void to_json(nlohmann::json& j, const SynthesisRequest& value);
void from_json(const nlohmann::json& j, SynthesisRequest& value);
void to_json(nlohmann::json& j, const AudioChunk& value);
void from_json(const nlohmann::json& j, AudioChunk& value);
void to_json(nlohmann::json& j, const ClearSignal& value);
void from_json(const nlohmann::json& j, ClearSignal& value);

}
}

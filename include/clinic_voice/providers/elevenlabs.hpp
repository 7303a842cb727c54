#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clinic_voice/config.hpp"
#include "clinic_voice/providers/speech.hpp"

namespace clinic_voice {
namespace providers {

struct SynthesizerSettings {
    std::string api_key;
    std::string voice_id;
    std::string url;
    std::string model;
    double timeout_sec = 30.0;
    double stability = 0.5;
    double similarity_boost = 0.75;

    static SynthesizerSettings from_config(const Config& config);
};

std::string build_stream_input_url(const SynthesizerSettings& settings);

// Opening, text and end-of-input messages for one utterance.
std::vector<nlohmann::json> build_synthesis_messages(const SynthesizerSettings& settings,
                                                     const std::string& text);

// Text to speech over the ElevenLabs stream-input websocket, one connection
// per utterance, returning 8 kHz mu-law.
class ElevenLabsSynthesizer : public SpeechSynthesizer {
public:
    explicit ElevenLabsSynthesizer(SynthesizerSettings settings);

    void synthesize(const std::string& text,
                    const utils::CancelFlag& cancel,
                    const AudioHandler& on_audio) override;

private:
    SynthesizerSettings settings_;
};

}
}

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "clinic_voice/config.hpp"
#include "clinic_voice/providers/speech.hpp"

namespace clinic_voice {
namespace providers {

struct RecognizerSettings {
    std::string api_key;
    std::string url;
    std::string model;
    int sample_rate = 8000;
    double connect_timeout_sec = 10.0;

    static RecognizerSettings from_config(const Config& config);
};

struct TranscriptResult {
    std::string text;
    bool is_final = false;
    bool speech_final = false;
};

// Parses a "Results" message; other message types yield nullopt.
std::optional<TranscriptResult> parse_transcript_message(const nlohmann::json& message);

std::string build_listen_url(const RecognizerSettings& settings);

// Streaming recognition over the Deepgram live websocket API.
class DeepgramRecognizer : public SpeechRecognizer {
public:
    explicit DeepgramRecognizer(RecognizerSettings settings);

    std::unique_ptr<RecognitionStream> open(const std::string& session_id,
                                            TranscriptHandler on_transcript) override;

private:
    RecognizerSettings settings_;
};

}
}

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "clinic_voice/audio/codec.hpp"
#include "clinic_voice/utils/cancel.hpp"

namespace clinic_voice {
namespace providers {

// Live recognition stream for one call.
class RecognitionStream {
public:
    virtual ~RecognitionStream() = default;

    virtual void send_audio(const audio::Pcm16& pcm) = 0;
    virtual void close() = 0;
};

class SpeechRecognizer {
public:
    using TranscriptHandler =
        std::function<void(const std::string& text, bool is_final, bool speech_final)>;

    virtual ~SpeechRecognizer() = default;

    // Blocks until the stream is connected. Throws ProviderError or
    // ProviderTimeoutError.
    virtual std::unique_ptr<RecognitionStream> open(const std::string& session_id,
                                                    TranscriptHandler on_transcript) = 0;
};

class SpeechSynthesizer {
public:
    using AudioHandler = std::function<void(const audio::UlawBytes& audio)>;

    virtual ~SpeechSynthesizer() = default;

    // Streams 8 kHz mu-law audio for the text until done or cancelled.
    virtual void synthesize(const std::string& text,
                            const utils::CancelFlag& cancel,
                            const AudioHandler& on_audio) = 0;
};

}
}

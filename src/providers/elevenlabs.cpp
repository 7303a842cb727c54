#include "clinic_voice/providers/elevenlabs.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "clinic_voice/errors.hpp"
#include "clinic_voice/logging.hpp"
#include "clinic_voice/providers/ws_client.hpp"
#include "clinic_voice/utils/http.hpp"

namespace clinic_voice::providers {

namespace {

constexpr auto kCancelPoll = std::chrono::milliseconds(20);

// Filled on the websocket io thread, drained by the synthesizing thread.
struct Inbox {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<audio::UlawBytes> audio;
    bool final = false;
    std::optional<std::string> error;
    std::optional<std::string> closed;
};

}

SynthesizerSettings SynthesizerSettings::from_config(const Config& config) {
    SynthesizerSettings settings;
    settings.api_key = config.tts_api_key;
    settings.voice_id = config.tts_voice_id;
    settings.url = config.tts_url;
    settings.model = config.tts_model;
    settings.timeout_sec = config.tts_timeout_sec;
    settings.stability = config.tts_stability;
    settings.similarity_boost = config.tts_similarity_boost;
    return settings;
}

std::string build_stream_input_url(const SynthesizerSettings& settings) {
    const auto base = utils::join_path(settings.url, "/" + settings.voice_id + "/stream-input");
    return utils::append_query(base, {{"model_id", settings.model},
                                      {"output_format", "ulaw_8000"}});
}

std::vector<nlohmann::json> build_synthesis_messages(const SynthesizerSettings& settings,
                                                     const std::string& text) {
    return {
        {{"text", " "},
         {"voice_settings",
          {{"stability", settings.stability},
           {"similarity_boost", settings.similarity_boost},
           {"style", 0.0},
           {"use_speaker_boost", true}}},
         {"xi_api_key", settings.api_key}},
        {{"text", text}, {"flush", true}},
        {{"text", ""}},
    };
}

ElevenLabsSynthesizer::ElevenLabsSynthesizer(SynthesizerSettings settings)
    : settings_(std::move(settings)) {}

void ElevenLabsSynthesizer::synthesize(const std::string& text,
                                       const utils::CancelFlag& cancel,
                                       const AudioHandler& on_audio) {
    if (utils::is_cancelled(cancel)) {
        return;
    }
    const auto started = std::chrono::steady_clock::now();
    const auto timeout =
        std::chrono::milliseconds(static_cast<long>(settings_.timeout_sec * 1000.0));
    const auto deadline = started + timeout;
    auto inbox = std::make_shared<Inbox>();

    WsConnection connection("elevenlabs");
    connection.connect(
        build_stream_input_url(settings_), {}, timeout,
        [inbox](const std::string& payload, bool binary) {
            if (binary) {
                return;
            }
            const auto message = nlohmann::json::parse(payload, nullptr, false);
            if (message.is_discarded() || !message.is_object()) {
                logging::warn("Malformed synthesizer message");
                return;
            }
            std::lock_guard<std::mutex> lock(inbox->mutex);
            if (message.contains("error")) {
                inbox->error = message["error"].dump();
            }
            const auto audio_field = message.find("audio");
            if (audio_field != message.end() && audio_field->is_string()) {
                auto decoded = audio::decode_payload(audio_field->get<std::string>());
                if (decoded) {
                    inbox->audio.push_back(std::move(*decoded));
                }
            }
            if (message.value("isFinal", false)) {
                inbox->final = true;
            }
            inbox->cv.notify_all();
        },
        [inbox](const std::string& reason) {
            std::lock_guard<std::mutex> lock(inbox->mutex);
            inbox->closed = reason;
            inbox->cv.notify_all();
        });

    for (const auto& message : build_synthesis_messages(settings_, text)) {
        if (!connection.send_text(message.dump())) {
            throw ProviderError("Synthesizer connection dropped while sending text");
        }
    }

    size_t total_bytes = 0;
    size_t chunks = 0;
    while (true) {
        std::deque<audio::UlawBytes> ready;
        bool final = false;
        std::optional<std::string> error;
        std::optional<std::string> closed;
        {
            std::unique_lock<std::mutex> lock(inbox->mutex);
            inbox->cv.wait_for(lock, kCancelPoll, [&inbox]() {
                return !inbox->audio.empty() || inbox->final || inbox->error || inbox->closed;
            });
            ready.swap(inbox->audio);
            final = inbox->final;
            error = inbox->error;
            closed = inbox->closed;
        }
        if (utils::is_cancelled(cancel)) {
            logging::debug("Synthesis cancelled", {kv("chunks", chunks)});
            break;
        }
        for (auto& chunk : ready) {
            total_bytes += chunk.size();
            chunks += 1;
            on_audio(chunk);
        }
        if (error) {
            throw ProviderError("Synthesizer error: " + *error);
        }
        if (final) {
            break;
        }
        if (closed) {
            if (chunks == 0) {
                throw ProviderError("Synthesizer closed without audio: " + *closed);
            }
            break;
        }
        if (std::chrono::steady_clock::now() > deadline) {
            throw ProviderTimeoutError("Synthesizer timed out");
        }
    }
    connection.close();

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
    logging::debug("Synthesized utterance",
                   {kv("bytes", total_bytes), kv("chunks", chunks),
                    kv("seconds", elapsed.count())});
}

}

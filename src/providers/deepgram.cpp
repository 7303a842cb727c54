#include "clinic_voice/providers/deepgram.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <utility>

#include "clinic_voice/logging.hpp"
#include "clinic_voice/providers/ws_client.hpp"
#include "clinic_voice/utils/http.hpp"
#include "clinic_voice/utils/text.hpp"

namespace clinic_voice::providers {

namespace {

class DeepgramStream : public RecognitionStream {
public:
    explicit DeepgramStream(std::string session_id)
        : session_id_(std::move(session_id)), connection_("deepgram:" + session_id_) {}

    ~DeepgramStream() override {
        close();
    }

    WsConnection& connection() { return connection_; }

    void send_audio(const audio::Pcm16& pcm) override {
        const auto bytes = audio::to_le_bytes(pcm);
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (!connection_.send_binary(bytes.data(), bytes.size()) && !warned_) {
            warned_ = true;
            logging::warn("Recognizer stream not accepting audio",
                          {kv("session_id", session_id_)});
        }
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            connection_.send_text(nlohmann::json{{"type", "CloseStream"}}.dump());
        }
        connection_.close();
        logging::info("Recognizer stream closed", {kv("session_id", session_id_)});
    }

private:
    std::string session_id_;
    WsConnection connection_;
    std::mutex mutex_;
    bool closed_ = false;
    bool warned_ = false;
};

}

RecognizerSettings RecognizerSettings::from_config(const Config& config) {
    RecognizerSettings settings;
    settings.api_key = config.stt_api_key;
    settings.url = config.stt_url;
    settings.model = config.stt_model;
    settings.sample_rate = config.stt_sample_rate;
    settings.connect_timeout_sec = config.stt_connect_timeout_sec;
    return settings;
}

std::optional<TranscriptResult> parse_transcript_message(const nlohmann::json& message) {
    if (!message.is_object() || message.value("type", std::string{}) != "Results") {
        return std::nullopt;
    }
    TranscriptResult result;
    result.is_final = message.value("is_final", false);
    result.speech_final = message.value("speech_final", false);
    const auto channel = message.find("channel");
    if (channel != message.end() && channel->is_object()) {
        const auto alternatives = channel->find("alternatives");
        if (alternatives != channel->end() && alternatives->is_array() &&
            !alternatives->empty() && alternatives->front().is_object()) {
            result.text = alternatives->front().value("transcript", std::string{});
        }
    }
    return result;
}

std::string build_listen_url(const RecognizerSettings& settings) {
    const std::map<std::string, std::string> query = {
        {"model", settings.model},
        {"encoding", "linear16"},
        {"sample_rate", std::to_string(settings.sample_rate)},
        {"channels", "1"},
        {"interim_results", "true"},
        {"smart_format", "true"},
        {"punctuate", "true"},
    };
    return utils::append_query(settings.url, query);
}

DeepgramRecognizer::DeepgramRecognizer(RecognizerSettings settings)
    : settings_(std::move(settings)) {}

std::unique_ptr<RecognitionStream> DeepgramRecognizer::open(const std::string& session_id,
                                                            TranscriptHandler on_transcript) {
    auto stream = std::make_unique<DeepgramStream>(session_id);
    const auto timeout = std::chrono::milliseconds(
        static_cast<long>(settings_.connect_timeout_sec * 1000.0));
    logging::info("Opening recognizer stream",
                  {kv("session_id", session_id), kv("sample_rate", settings_.sample_rate),
                   kv("model", settings_.model)});

    auto handler = [session_id, on_transcript = std::move(on_transcript)](
                       const std::string& payload, bool binary) {
        if (binary) {
            return;
        }
        const auto message = nlohmann::json::parse(payload, nullptr, false);
        if (message.is_discarded()) {
            logging::warn("Malformed recognizer message", {kv("session_id", session_id)});
            return;
        }
        const auto result = parse_transcript_message(message);
        if (!result || utils::trim(result->text).empty()) {
            return;
        }
        if (result->is_final) {
            logging::info("Caller said", {kv("session_id", session_id),
                                          kv("transcript", result->text)});
        }
        on_transcript(result->text, result->is_final, result->speech_final);
    };
    auto on_close = [session_id](const std::string& reason) {
        logging::info("Recognizer connection ended",
                      {kv("session_id", session_id), kv("reason", reason)});
    };
    stream->connection().connect(build_listen_url(settings_),
                                 {{"Authorization", "Token " + settings_.api_key}}, timeout,
                                 std::move(handler), std::move(on_close));
    return stream;
}

}

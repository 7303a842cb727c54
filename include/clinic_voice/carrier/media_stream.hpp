#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clinic_voice/audio/codec.hpp"
#include "clinic_voice/playback/scheduler.hpp"

namespace clinic_voice {
namespace carrier {

enum class StreamEventType { connected, start, media, mark, stop, unknown };

struct StreamEvent {
    StreamEventType type = StreamEventType::unknown;
    std::string stream_sid;
    std::string call_sid;
    // Base64 media payload, or the mark name.
    std::string payload;
};

// Parses one inbound media stream frame. Returns nullopt for non-JSON input.
std::optional<StreamEvent> parse_stream_event(const std::string& text);

nlohmann::json make_media_event(const std::string& stream_sid, const std::vector<uint8_t>& chunk);
nlohmann::json make_clear_event(const std::string& stream_sid);
nlohmann::json make_mark_event(const std::string& stream_sid, const std::string& name);

// Answer to the voice webhook connecting the call to the media stream.
std::string build_twiml(const std::string& stream_url);

// Picks the advertised stream URL, else derives it from the webhook Host header.
std::string resolve_stream_url(const std::optional<std::string>& public_stream_url,
                               const std::string& host);

// Playback sink writing outbound media stream events for one call.
class MediaStreamSink : public playback::AudioSink {
public:
    using Sender = std::function<bool(const std::string& text)>;

    MediaStreamSink(std::string stream_sid, Sender sender);

    void send_audio(const std::vector<uint8_t>& chunk) override;
    void send_clear() override;
    void send_mark(const std::string& name) override;

    // Stops forwarding once the carrier side is gone.
    void detach();

private:
    void send(const nlohmann::json& event);

    std::string stream_sid_;
    std::mutex mutex_;
    Sender sender_;
};

}
}

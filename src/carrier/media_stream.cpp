#include "clinic_voice/carrier/media_stream.hpp"

#include <utility>

#include "clinic_voice/logging.hpp"
#include "clinic_voice/utils/text.hpp"

namespace clinic_voice::carrier {

namespace {

StreamEventType event_type_from(const std::string& name) {
    if (name == "connected") {
        return StreamEventType::connected;
    }
    if (name == "start") {
        return StreamEventType::start;
    }
    if (name == "media") {
        return StreamEventType::media;
    }
    if (name == "mark") {
        return StreamEventType::mark;
    }
    if (name == "stop") {
        return StreamEventType::stop;
    }
    return StreamEventType::unknown;
}

std::string string_field(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return {};
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

bool is_local_host(const std::string& host) {
    return host.rfind("localhost", 0) == 0 || host.rfind("127.0.0.1", 0) == 0;
}

}

std::optional<StreamEvent> parse_stream_event(const std::string& text) {
    const auto message = nlohmann::json::parse(text, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        return std::nullopt;
    }
    StreamEvent event;
    event.type = event_type_from(string_field(message, "event"));
    event.stream_sid = string_field(message, "streamSid");
    switch (event.type) {
        case StreamEventType::start: {
            const auto start = message.find("start");
            if (start != message.end()) {
                event.call_sid = string_field(*start, "callSid");
                const auto stream_sid = string_field(*start, "streamSid");
                if (!stream_sid.empty()) {
                    event.stream_sid = stream_sid;
                }
            }
            break;
        }
        case StreamEventType::media: {
            const auto media = message.find("media");
            if (media != message.end()) {
                event.payload = string_field(*media, "payload");
            }
            break;
        }
        case StreamEventType::mark: {
            const auto mark = message.find("mark");
            if (mark != message.end()) {
                event.payload = string_field(*mark, "name");
            }
            break;
        }
        case StreamEventType::stop: {
            const auto stop = message.find("stop");
            if (stop != message.end()) {
                event.call_sid = string_field(*stop, "callSid");
            }
            break;
        }
        default:
            break;
    }
    return event;
}

nlohmann::json make_media_event(const std::string& stream_sid, const std::vector<uint8_t>& chunk) {
    return {{"event", "media"},
            {"streamSid", stream_sid},
            {"media", {{"payload", audio::encode_payload(chunk)}}}};
}

nlohmann::json make_clear_event(const std::string& stream_sid) {
    return {{"event", "clear"}, {"streamSid", stream_sid}};
}

nlohmann::json make_mark_event(const std::string& stream_sid, const std::string& name) {
    return {{"event", "mark"}, {"streamSid", stream_sid}, {"mark", {{"name", name}}}};
}

std::string build_twiml(const std::string& stream_url) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
           "<Response><Connect><Stream url=\"" +
           utils::xml_escape(stream_url) +
           "\"/></Connect><Pause length=\"600\"/></Response>";
}

std::string resolve_stream_url(const std::optional<std::string>& public_stream_url,
                               const std::string& host) {
    if (public_stream_url && !public_stream_url->empty()) {
        return *public_stream_url;
    }
    return (is_local_host(host) ? "ws://" : "wss://") + host;
}

MediaStreamSink::MediaStreamSink(std::string stream_sid, Sender sender)
    : stream_sid_(std::move(stream_sid)), sender_(std::move(sender)) {}

void MediaStreamSink::send_audio(const std::vector<uint8_t>& chunk) {
    send(make_media_event(stream_sid_, chunk));
}

void MediaStreamSink::send_clear() {
    logging::debug("Sending carrier clear", {kv("stream_sid", stream_sid_)});
    send(make_clear_event(stream_sid_));
}

void MediaStreamSink::send_mark(const std::string& name) {
    send(make_mark_event(stream_sid_, name));
}

void MediaStreamSink::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    sender_ = nullptr;
}

void MediaStreamSink::send(const nlohmann::json& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sender_) {
        return;
    }
    if (!sender_(event.dump())) {
        logging::debug("Carrier send failed", {kv("stream_sid", stream_sid_)});
    }
}

}

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "clinic_voice/audio/codec.hpp"
#include "clinic_voice/carrier/media_stream.hpp"
#include "clinic_voice/config.hpp"

namespace clinic_voice {
namespace carrier {

struct CallHandlers {
    // Returns the session id serving the call.
    std::function<std::string(const std::string& call_sid,
                              const std::string& stream_sid,
                              std::shared_ptr<playback::AudioSink> sink)>
        on_start;
    std::function<void(const std::string& session_id, const audio::UlawBytes& frame)> on_media;
    std::function<void(const std::string& session_id)> on_stop;
};

// Voice webhook and media stream websocket on one listener.
class MediaStreamServer {
public:
    MediaStreamServer(const Config& config, CallHandlers handlers);
    ~MediaStreamServer();

    // Throws std::runtime_error when the listener cannot be opened.
    void start();
    void stop();

private:
    using Server = websocketpp::server<websocketpp::config::asio>;

    struct CallState {
        std::string session_id;
        std::string call_sid;
        std::shared_ptr<MediaStreamSink> sink;
        size_t malformed_frames = 0;
    };

    void on_http(websocketpp::connection_hdl hdl);
    void on_message(websocketpp::connection_hdl hdl, Server::message_ptr message);
    void on_close(websocketpp::connection_hdl hdl);
    void handle_start(websocketpp::connection_hdl hdl, const StreamEvent& event);
    void end_call(websocketpp::connection_hdl hdl, const std::string& why);

    const Config& config_;
    CallHandlers handlers_;
    Server server_;
    std::mutex calls_mutex_;
    std::map<websocketpp::connection_hdl, CallState, std::owner_less<websocketpp::connection_hdl>>
        calls_;
    std::thread worker_;
    bool running_ = false;
};

}
}

#include "clinic_voice/carrier/media_stream_server.hpp"

#include <exception>
#include <stdexcept>
#include <vector>

#include "clinic_voice/logging.hpp"

namespace clinic_voice::carrier {

namespace {

constexpr size_t kMalformedLogEvery = 100;

}

MediaStreamServer::MediaStreamServer(const Config& config, CallHandlers handlers)
    : config_(config), handlers_(std::move(handlers)) {
    server_.clear_access_channels(websocketpp::log::alevel::all);
    server_.clear_error_channels(websocketpp::log::elevel::all);
    server_.set_reuse_addr(true);
    server_.set_http_handler([this](websocketpp::connection_hdl hdl) { on_http(hdl); });
    server_.set_open_handler([](websocketpp::connection_hdl) {
        logging::info("Media stream connected");
    });
    server_.set_message_handler(
        [this](websocketpp::connection_hdl hdl, Server::message_ptr message) {
            on_message(hdl, message);
        });
    server_.set_close_handler([this](websocketpp::connection_hdl hdl) { on_close(hdl); });
    server_.set_fail_handler([this](websocketpp::connection_hdl hdl) { on_close(hdl); });
}

MediaStreamServer::~MediaStreamServer() {
    stop();
}

void MediaStreamServer::start() {
    websocketpp::lib::error_code ec;
    server_.init_asio(ec);
    if (ec) {
        throw std::runtime_error("Media stream server init failed: " + ec.message());
    }
    server_.listen(config_.carrier_host, std::to_string(config_.carrier_port), ec);
    if (ec) {
        throw std::runtime_error("Media stream server cannot listen on port " +
                                 std::to_string(config_.carrier_port) + ": " + ec.message());
    }
    server_.start_accept(ec);
    if (ec) {
        throw std::runtime_error("Media stream server accept failed: " + ec.message());
    }
    running_ = true;
    worker_ = std::thread([this]() {
        logging::info("Carrier listener ready",
                      {kv("host", config_.carrier_host), kv("port", config_.carrier_port)});
        try {
            server_.run();
        } catch (const std::exception& ex) {
            logging::error("Carrier listener stopped", {kv("error", ex.what())});
        }
    });
}

void MediaStreamServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    websocketpp::lib::error_code ec;
    server_.stop_listening(ec);

    std::vector<websocketpp::connection_hdl> open;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        for (auto& entry : calls_) {
            open.push_back(entry.first);
            if (entry.second.sink) {
                entry.second.sink->detach();
            }
        }
    }
    for (auto& hdl : open) {
        server_.close(hdl, websocketpp::close::status::going_away, "shutdown", ec);
    }
    server_.stop();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void MediaStreamServer::on_http(websocketpp::connection_hdl hdl) {
    websocketpp::lib::error_code ec;
    auto connection = server_.get_con_from_hdl(hdl, ec);
    if (ec) {
        return;
    }
    const auto& request = connection->get_request();
    const auto& method = request.get_method();
    auto resource = request.get_uri();
    const auto query = resource.find('?');
    if (query != std::string::npos) {
        resource.erase(query);
    }

    if (method == "POST" && resource == "/voice") {
        const auto url = resolve_stream_url(config_.public_stream_url,
                                            request.get_header("Host"));
        logging::info("Incoming call", {kv("stream_url", url)});
        connection->append_header("Content-Type", "text/xml");
        connection->set_body(build_twiml(url));
        connection->set_status(websocketpp::http::status_code::ok);
        return;
    }
    if (method == "POST" && (resource == "/voice/stream" || resource == "/voice/status")) {
        connection->set_body("OK");
        connection->set_status(websocketpp::http::status_code::ok);
        return;
    }
    logging::debug("Unknown carrier request", {kv("method", method), kv("path", resource)});
    connection->set_status(websocketpp::http::status_code::not_found);
}

void MediaStreamServer::on_message(websocketpp::connection_hdl hdl,
                                   Server::message_ptr message) {
    const auto event = parse_stream_event(message->get_payload());
    if (!event) {
        logging::warn("Dropping malformed media stream frame");
        return;
    }
    switch (event->type) {
        case StreamEventType::connected:
            logging::debug("Media stream handshake");
            break;
        case StreamEventType::start:
            handle_start(hdl, *event);
            break;
        case StreamEventType::media: {
            std::string session_id;
            {
                std::lock_guard<std::mutex> lock(calls_mutex_);
                const auto it = calls_.find(hdl);
                if (it == calls_.end()) {
                    return;
                }
                session_id = it->second.session_id;
            }
            auto frame = audio::decode_payload(event->payload);
            if (!frame) {
                std::lock_guard<std::mutex> lock(calls_mutex_);
                const auto it = calls_.find(hdl);
                if (it != calls_.end() &&
                    it->second.malformed_frames++ % kMalformedLogEvery == 0) {
                    logging::warn("Dropping malformed caller audio",
                                  {kv("session_id", session_id),
                                   kv("count", it->second.malformed_frames)});
                }
                return;
            }
            if (handlers_.on_media) {
                handlers_.on_media(session_id, *frame);
            }
            break;
        }
        case StreamEventType::mark:
            logging::debug("Carrier played mark", {kv("name", event->payload)});
            break;
        case StreamEventType::stop:
            end_call(hdl, "stop");
            break;
        case StreamEventType::unknown:
            logging::debug("Ignoring media stream event");
            break;
    }
}

void MediaStreamServer::handle_start(websocketpp::connection_hdl hdl, const StreamEvent& event) {
    auto sink = std::make_shared<MediaStreamSink>(
        event.stream_sid, [this, hdl](const std::string& text) {
            websocketpp::lib::error_code ec;
            server_.send(hdl, text, websocketpp::frame::opcode::text, ec);
            return !ec;
        });
    std::string session_id;
    try {
        session_id = handlers_.on_start ? handlers_.on_start(event.call_sid, event.stream_sid, sink)
                                        : std::string{};
    } catch (const std::exception& ex) {
        logging::error("Failed to start call session",
                       {kv("call_sid", event.call_sid), kv("error", ex.what())});
        websocketpp::lib::error_code ec;
        server_.close(hdl, websocketpp::close::status::internal_endpoint_error, "session failed",
                      ec);
        return;
    }
    logging::info("Call started", {kv("session_id", session_id), kv("call_sid", event.call_sid),
                                   kv("stream_sid", event.stream_sid)});
    std::lock_guard<std::mutex> lock(calls_mutex_);
    auto& state = calls_[hdl];
    state.session_id = session_id;
    state.call_sid = event.call_sid;
    state.sink = std::move(sink);
}

void MediaStreamServer::on_close(websocketpp::connection_hdl hdl) {
    end_call(hdl, "disconnect");
}

void MediaStreamServer::end_call(websocketpp::connection_hdl hdl, const std::string& why) {
    CallState state;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        const auto it = calls_.find(hdl);
        if (it == calls_.end()) {
            return;
        }
        state = std::move(it->second);
        calls_.erase(it);
    }
    if (state.sink) {
        state.sink->detach();
    }
    logging::info("Call ended", {kv("session_id", state.session_id),
                                 kv("call_sid", state.call_sid), kv("reason", why)});
    if (handlers_.on_stop) {
        try {
            handlers_.on_stop(state.session_id);
        } catch (const std::exception& ex) {
            logging::error("Failed to close call session",
                           {kv("session_id", state.session_id), kv("error", ex.what())});
        }
    }
}

}

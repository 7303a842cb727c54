#include "clinic_voice/server/rest_server.hpp"

#include <stdexcept>

#include "clinic_voice/logging.hpp"
#include "clinic_voice/metrics.hpp"

namespace clinic_voice {

RestServer::RestServer(const Config& config, SessionsHandler on_sessions)
    : config_(config), on_sessions_(std::move(on_sessions)) {}

void RestServer::mount(httplib::Server& server) {
    server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server.Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(), "text/plain; version=0.0.4");
    });

    server.Get("/sessions", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        try {
            nlohmann::json payload{{"sessions", on_sessions_ ? on_sessions_()
                                                             : nlohmann::json::array()}};
            res.set_content(payload.dump(), "application/json");
        } catch (const std::exception& ex) {
            logging::error("Failed to list sessions", {kv("error", ex.what())});
            res.status = 500;
            res.set_content(R"({"message":"failed to list sessions"})", "application/json");
        }
    });
}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();
    mount(*server_);
    if (!server_->bind_to_port("0.0.0.0", config_.rest_api_port)) {
        throw std::runtime_error("REST server cannot bind port " +
                                 std::to_string(config_.rest_api_port));
    }
    server_thread_ = std::thread([this]() {
        logging::info("REST server listening", {kv("port", config_.rest_api_port)});
        server_->listen_after_bind();
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

}

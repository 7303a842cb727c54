#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "clinic_voice/config.hpp"

namespace clinic_voice {

class RestServer {
public:
    using SessionsHandler = std::function<nlohmann::json()>;

    RestServer(const Config& config, SessionsHandler on_sessions);

    void start();
    void stop();

private:
    void mount(httplib::Server& server);
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;

    const Config& config_;
    SessionsHandler on_sessions_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}

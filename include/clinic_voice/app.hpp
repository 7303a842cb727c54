#pragma once

#include <atomic>
#include <memory>

#include <nlohmann/json.hpp>

#include "clinic_voice/bus/message_bus.hpp"
#include "clinic_voice/carrier/media_stream_server.hpp"
#include "clinic_voice/config.hpp"
#include "clinic_voice/pipeline/orchestrator.hpp"
#include "clinic_voice/routing/knowledge_base.hpp"
#include "clinic_voice/server/rest_server.hpp"

namespace clinic_voice {

class App {
public:
    explicit App(Config config);
    ~App();

    void init();
    // Serves calls until stop() or until the interrupted flag is raised.
    void run(const std::atomic<bool>& interrupted);
    void stop();

    const Config& config() const;

private:
    std::shared_ptr<routing::KnowledgeBase> load_knowledge_base();
    nlohmann::json list_sessions();

    Config config_;
    std::shared_ptr<bus::LocalBus> bus_;
    std::unique_ptr<pipeline::Orchestrator> orchestrator_;
    std::unique_ptr<carrier::MediaStreamServer> media_server_;
    std::unique_ptr<RestServer> rest_server_;
    std::atomic<bool> quitting_{false};
    bool stopped_ = false;
};

}

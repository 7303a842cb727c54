#include "clinic_voice/app.hpp"

#include <chrono>
#include <thread>

#include "clinic_voice/errors.hpp"
#include "clinic_voice/logging.hpp"
#include "clinic_voice/providers/chat.hpp"
#include "clinic_voice/providers/deepgram.hpp"
#include "clinic_voice/providers/elevenlabs.hpp"

namespace clinic_voice {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(100);

}

App::App(Config config)
    : config_(std::move(config)) {}

App::~App() {
    stop();
}

const Config& App::config() const {
    return config_;
}

void App::init() {
    bus_ = std::make_shared<bus::LocalBus>();

    pipeline::PipelineComponents components;
    components.bus = bus_;
    components.recognizer = std::make_shared<providers::DeepgramRecognizer>(
        providers::RecognizerSettings::from_config(config_));
    components.synthesizer = std::make_shared<providers::ElevenLabsSynthesizer>(
        providers::SynthesizerSettings::from_config(config_));
    components.generator = providers::make_reply_generator(config_);
    components.router = std::make_shared<routing::QueryRouter>(
        load_knowledge_base(), config_.rag_keywords,
        routing::RouterThresholds::from_config(config_));

    orchestrator_ = std::make_unique<pipeline::Orchestrator>(config_, std::move(components));
    orchestrator_->start();

    carrier::CallHandlers handlers;
    handlers.on_start = [this](const std::string& call_sid, const std::string& stream_sid,
                               std::shared_ptr<playback::AudioSink> sink) {
        return orchestrator_->open_session(call_sid, stream_sid, std::move(sink))->id();
    };
    handlers.on_media = [this](const std::string& session_id, const audio::UlawBytes& frame) {
        orchestrator_->on_caller_audio(session_id, frame);
    };
    handlers.on_stop = [this](const std::string& session_id) {
        orchestrator_->close_session(session_id);
    };
    media_server_ = std::make_unique<carrier::MediaStreamServer>(config_, std::move(handlers));
    media_server_->start();

    rest_server_ = std::make_unique<RestServer>(config_, [this]() { return list_sessions(); });
    rest_server_->start();

    logging::info("Clinic voice agent ready",
                  {kv("carrier_port", config_.carrier_port),
                   kv("rest_port", config_.rest_api_port),
                   kv("llm_provider", config_.llm_provider)});
}

void App::run(const std::atomic<bool>& interrupted) {
    while (!quitting_ && !interrupted) {
        std::this_thread::sleep_for(kPollInterval);
    }
    stop();
}

void App::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    quitting_ = true;
    logging::info("Shutting down");
    if (rest_server_) {
        rest_server_->stop();
    }
    if (orchestrator_) {
        orchestrator_->shutdown();
    }
    if (media_server_) {
        media_server_->stop();
    }
    if (bus_) {
        bus_->close();
    }
}

std::shared_ptr<routing::KnowledgeBase> App::load_knowledge_base() {
    if (!config_.kb_index_path) {
        logging::warn("No knowledge index configured, answering without retrieval");
        return nullptr;
    }
    auto embedder = std::make_shared<providers::OpenAiEmbedder>(
        config_.embedding_base_url, config_.embedding_api_key, config_.embedding_model,
        config_.embedding_timeout_sec);
    auto index = std::make_shared<routing::VectorIndex>(std::move(embedder));
    try {
        index->load(*config_.kb_index_path);
    } catch (const KnowledgeBaseError& ex) {
        logging::warn("Knowledge index unavailable, answering without retrieval",
                      {kv("path", config_.kb_index_path->string()), kv("error", ex.what())});
        return nullptr;
    }
    return index;
}

nlohmann::json App::list_sessions() {
    auto sessions = nlohmann::json::array();
    if (!orchestrator_) {
        return sessions;
    }
    for (const auto& session : orchestrator_->registry().list()) {
        sessions.push_back({{"session_id", session->id()},
                            {"call_sid", session->call_sid()},
                            {"stream_sid", session->stream_sid()}});
    }
    return sessions;
}

}

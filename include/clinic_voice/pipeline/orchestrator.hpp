#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "clinic_voice/audio/codec.hpp"
#include "clinic_voice/bus/message_bus.hpp"
#include "clinic_voice/bus/messages.hpp"
#include "clinic_voice/config.hpp"
#include "clinic_voice/interrupt/controller.hpp"
#include "clinic_voice/playback/scheduler.hpp"
#include "clinic_voice/providers/speech.hpp"
#include "clinic_voice/reply/reply_streamer.hpp"
#include "clinic_voice/routing/query_router.hpp"
#include "clinic_voice/session/registry.hpp"

namespace clinic_voice {
namespace pipeline {

struct PipelineComponents {
    std::shared_ptr<bus::MessageBus> bus;
    std::shared_ptr<providers::SpeechRecognizer> recognizer;
    std::shared_ptr<providers::SpeechSynthesizer> synthesizer;
    std::shared_ptr<routing::QueryRouter> router;
    std::shared_ptr<reply::ReplyGenerator> generator;
};

// Wires the per-call stages together through the message bus:
// transcripts -> routing and generation -> synthesis -> playback.
class Orchestrator {
public:
    Orchestrator(Config config, PipelineComponents components);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Registers the queue consumers.
    void start();

    std::shared_ptr<session::Session> open_session(const std::string& call_sid,
                                                   const std::string& stream_sid,
                                                   std::shared_ptr<playback::AudioSink> sink);
    void on_caller_audio(const std::string& session_id, const audio::UlawBytes& frame);
    bool close_session(const std::string& session_id);

    // Closes every session and waits for outstanding turn tasks.
    void shutdown();

    session::SessionRegistry& registry();

private:
    void handle_transcript(const nlohmann::json& message);
    void handle_generation_request(const nlohmann::json& message);
    void handle_synthesis_request(const nlohmann::json& message);
    void handle_audio_output(const nlohmann::json& message);
    void handle_clear_audio(const nlohmann::json& message);

    void start_turn(const std::shared_ptr<session::Session>& session, const std::string& text);
    void run_turn(const std::shared_ptr<session::Session>& session,
                  const bus::GenerationRequest& request,
                  const utils::CancelFlag& cancel);
    void publish_sentence(session::Session& session, uint64_t turn_id, const std::string& text);
    void publish_clear(const session::Session& session, uint64_t turn_id,
                       const std::string& reason);
    void connect_recognizer(const std::shared_ptr<session::Session>& session);
    void speak_greeting(const std::shared_ptr<session::Session>& session);
    std::shared_ptr<session::Session> lookup(const std::string& session_id,
                                             const std::string& queue) const;

    void spawn(const std::string& name, std::function<void()> task);
    void finish_task();

    Config config_;
    PipelineComponents components_;
    reply::ReplyStreamer streamer_;
    interrupt::InterruptionController interruptions_;
    session::SessionRegistry registry_;

    std::mutex tasks_mutex_;
    std::condition_variable tasks_cv_;
    size_t running_tasks_ = 0;
    bool started_ = false;
    bool shut_down_ = false;
};

}
}

#include "clinic_voice/pipeline/orchestrator.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>

#include "clinic_voice/errors.hpp"
#include "clinic_voice/logging.hpp"
#include "clinic_voice/metrics.hpp"
#include "clinic_voice/utils/async.hpp"
#include "clinic_voice/utils/text.hpp"

namespace clinic_voice::pipeline {

namespace {

double seconds_since(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
}

std::string outcome_name(routing::AnswerStrategy strategy, reply::ReplyStatus status) {
    switch (status) {
        case reply::ReplyStatus::cancelled: return "cancelled";
        case reply::ReplyStatus::failed: return "failed";
        case reply::ReplyStatus::completed: break;
    }
    return routing::to_string(strategy);
}

}

Orchestrator::Orchestrator(Config config, PipelineComponents components)
    : config_(std::move(config)),
      components_(std::move(components)),
      streamer_(components_.generator,
                reply::GenerationParams::from_config(config_),
                config_.apology_text),
      interruptions_(config_.interruptions_are_allowed,
                     [this](session::Session& session, uint64_t turn_id) {
                         publish_clear(session, turn_id, "barge_in");
                     }) {
    if (!components_.bus) {
        throw std::invalid_argument("orchestrator requires a message bus");
    }
}

Orchestrator::~Orchestrator() {
    shutdown();
}

void Orchestrator::start() {
    if (started_) {
        return;
    }
    auto& message_bus = *components_.bus;
    message_bus.consume(bus::queues::kTranscription,
                        [this](const nlohmann::json& message) { handle_transcript(message); });
    message_bus.consume(bus::queues::kGenerationRequest,
                        [this](const nlohmann::json& message) { handle_generation_request(message); });
    message_bus.consume(bus::queues::kSynthesisRequest,
                        [this](const nlohmann::json& message) { handle_synthesis_request(message); });
    message_bus.consume(bus::queues::kAudioOutput,
                        [this](const nlohmann::json& message) { handle_audio_output(message); });
    message_bus.consume(bus::queues::kClearAudio,
                        [this](const nlohmann::json& message) { handle_clear_audio(message); });
    started_ = true;
    logging::info("Pipeline consumers started");
}

std::shared_ptr<session::Session> Orchestrator::open_session(
    const std::string& call_sid,
    const std::string& stream_sid,
    std::shared_ptr<playback::AudioSink> sink) {
    session::SessionInfo info{session::generate_session_id(), call_sid, stream_sid};
    auto message_bus = components_.bus;
    auto on_audio = [message_bus](const bus::AudioChunk& chunk) {
        message_bus->publish(bus::queues::kAudioOutput, chunk);
    };
    auto session = std::make_shared<session::Session>(info, config_, std::move(sink),
                                                      components_.synthesizer,
                                                      std::move(on_audio));
    registry_.add(session);
    logging::info("Session opened",
                  {kv("session_id", session->id()), kv("call_sid", call_sid),
                   kv("stream_sid", stream_sid)});

    connect_recognizer(session);
    if (!config_.greeting_text.empty()) {
        speak_greeting(session);
    }
    return session;
}

void Orchestrator::on_caller_audio(const std::string& session_id,
                                   const audio::UlawBytes& frame) {
    if (frame.empty()) {
        return;
    }
    auto session = registry_.get(session_id);
    if (!session) {
        logging::debug("Audio for unknown session", {kv("session_id", session_id)});
        return;
    }
    auto pcm = audio::decode(frame, config_.inbound_gain);
    if (config_.stt_sample_rate == 16000) {
        pcm = audio::upsample_8k_to_16k(pcm);
    }
    try {
        session->send_caller_audio(pcm);
    } catch (const std::exception& ex) {
        logging::warn("Failed to forward caller audio",
                      {kv("session_id", session_id), kv("error", ex.what())});
    }
}

bool Orchestrator::close_session(const std::string& session_id) {
    return registry_.destroy(session_id);
}

void Orchestrator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
    }
    tasks_cv_.notify_all();
    registry_.close_all();
    // Tasks call back into this object, so every one must finish before we return.
    std::unique_lock<std::mutex> lock(tasks_mutex_);
    const auto limit = std::chrono::duration<double>(config_.llm_timeout_sec + 1.0);
    if (!tasks_cv_.wait_for(lock, limit, [this]() { return running_tasks_ == 0; })) {
        logging::warn("Turn tasks still running at shutdown", {kv("count", running_tasks_)});
        tasks_cv_.wait(lock, [this]() { return running_tasks_ == 0; });
    }
}

session::SessionRegistry& Orchestrator::registry() {
    return registry_;
}

std::shared_ptr<session::Session> Orchestrator::lookup(const std::string& session_id,
                                                       const std::string& queue) const {
    auto session = registry_.get(session_id);
    if (!session) {
        logging::warn("Message for unknown or ended session ignored",
                      {kv("session_id", session_id), kv("queue", queue)});
    }
    return session;
}

void Orchestrator::handle_transcript(const nlohmann::json& message) {
    const auto event = message.get<bus::TranscriptEvent>();
    auto session = lookup(event.session_id, bus::queues::kTranscription);
    if (!session) {
        return;
    }
    interruptions_.handle(*session, event, interrupt::Clock::now());
    if (!event.is_final) {
        return;
    }
    const auto text = utils::trim(event.text);
    if (text.empty()) {
        return;
    }
    logging::info("Caller said", {kv("session_id", session->id()), kv("text", text)});
    start_turn(session, text);
}

void Orchestrator::start_turn(const std::shared_ptr<session::Session>& session,
                              const std::string& text) {
    const bool was_speaking = session->is_speaking();
    const auto ticket = session->begin_turn();
    if (was_speaking && ticket.turn_id > 1) {
        const auto previous = ticket.turn_id - 1;
        session->synthesis().cancel_through(previous);
        session->scheduler().cancel_through(previous);
        publish_clear(*session, previous, "new_turn");
    }
    bus::GenerationRequest request{session->id(), ticket.turn_id, text};
    components_.bus->publish(bus::queues::kGenerationRequest, request);
}

void Orchestrator::handle_generation_request(const nlohmann::json& message) {
    const auto request = message.get<bus::GenerationRequest>();
    auto session = lookup(request.session_id, bus::queues::kGenerationRequest);
    if (!session) {
        return;
    }
    const auto ticket = session->ticket_for(request.turn_id);
    if (!ticket || utils::is_cancelled(ticket->cancel)) {
        logging::debug("Generation request superseded",
                       {kv("session_id", session->id()), kv("turn_id", request.turn_id)});
        Metrics::instance().increment_turn("cancelled");
        return;
    }
    const auto cancel = ticket->cancel;
    spawn("turn", [this, session, request, cancel]() { run_turn(session, request, cancel); });
}

void Orchestrator::run_turn(const std::shared_ptr<session::Session>& session,
                            const bus::GenerationRequest& request,
                            const utils::CancelFlag& cancel) {
    const auto started = std::chrono::steady_clock::now();
    std::string outcome = "failed";
    auto generation = session->lock_generation();
    try {
        auto decision = components_.router ? components_.router->route(request.transcript)
                                           : routing::RouteDecision{};
        Metrics::instance().observe_latency("route", seconds_since(started));
        logging::info("Answer strategy selected",
                      {kv("session_id", session->id()), kv("turn_id", request.turn_id),
                       kv("tier", routing::to_string(decision.tier)),
                       kv("strategy", routing::to_string(decision.strategy)),
                       kv("passages", decision.passages.size())});

        if (utils::is_cancelled(cancel)) {
            outcome = "cancelled";
        } else if (decision.strategy == routing::AnswerStrategy::direct &&
                   decision.direct_answer) {
            publish_sentence(*session, request.turn_id, *decision.direct_answer);
            Metrics::instance().observe_latency("first_sentence", seconds_since(started));
            session->history().append_exchange(request.transcript, *decision.direct_answer);
            outcome = "direct";
        } else {
            reply::ReplyRequest reply_request;
            reply_request.user_text = request.transcript;
            if (decision.strategy == routing::AnswerStrategy::grounded) {
                reply_request.context = decision.context;
            }
            bool first = true;
            const auto result = streamer_.stream(
                session->history(), reply_request, cancel,
                [&](const std::string& sentence) {
                    if (first) {
                        Metrics::instance().observe_latency("first_sentence",
                                                            seconds_since(started));
                        first = false;
                    }
                    publish_sentence(*session, request.turn_id, sentence);
                });
            outcome = outcome_name(decision.strategy, result.status);
        }
    } catch (const std::exception& ex) {
        logging::error("Turn failed",
                       {kv("session_id", session->id()), kv("turn_id", request.turn_id),
                        kv("error", ex.what())});
        if (!utils::is_cancelled(cancel)) {
            publish_sentence(*session, request.turn_id, config_.apology_text);
        }
        outcome = utils::is_cancelled(cancel) ? "cancelled" : "failed";
    }
    generation.unlock();
    session->release_turn(request.turn_id);
    Metrics::instance().increment_turn(outcome);
    logging::info("Turn finished",
                  {kv("session_id", session->id()), kv("turn_id", request.turn_id),
                   kv("outcome", outcome), kv("elapsed_sec", seconds_since(started))});
}

void Orchestrator::publish_sentence(session::Session& session,
                                    uint64_t turn_id,
                                    const std::string& text) {
    bus::SynthesisRequest request{session.id(), turn_id, session.next_utterance_id(), text};
    logging::debug("Sentence ready",
                   {kv("session_id", session.id()), kv("turn_id", turn_id),
                    kv("utterance_id", request.utterance_id), kv("text", text)});
    components_.bus->publish(bus::queues::kSynthesisRequest, request);
}

void Orchestrator::publish_clear(const session::Session& session,
                                 uint64_t turn_id,
                                 const std::string& reason) {
    bus::ClearSignal signal{session.id(), turn_id, reason};
    components_.bus->publish(bus::queues::kClearAudio, signal);
}

void Orchestrator::handle_synthesis_request(const nlohmann::json& message) {
    auto request = message.get<bus::SynthesisRequest>();
    auto session = lookup(request.session_id, bus::queues::kSynthesisRequest);
    if (!session) {
        return;
    }
    session->synthesis().enqueue(std::move(request));
}

void Orchestrator::handle_audio_output(const nlohmann::json& message) {
    const auto chunk = message.get<bus::AudioChunk>();
    auto session = lookup(chunk.session_id, bus::queues::kAudioOutput);
    if (!session) {
        return;
    }
    auto& scheduler = session->scheduler();
    if (chunk.end) {
        scheduler.finish(chunk.turn_id, chunk.utterance_id);
        return;
    }
    const auto bytes = audio::decode_payload(chunk.payload);
    if (!bytes) {
        return;
    }
    if (scheduler.append(chunk.turn_id, chunk.utterance_id, *bytes)) {
        if (const auto latency = session->take_first_audio_latency(chunk.turn_id)) {
            Metrics::instance().observe_latency("first_audio", *latency);
        }
    }
}

void Orchestrator::handle_clear_audio(const nlohmann::json& message) {
    const auto signal = message.get<bus::ClearSignal>();
    auto session = lookup(signal.session_id, bus::queues::kClearAudio);
    if (!session) {
        return;
    }
    session->synthesis().cancel_through(signal.turn_id);
    const auto cleared = session->scheduler().cleared_through();
    if (!cleared || *cleared < signal.turn_id) {
        session->scheduler().cancel_through(signal.turn_id);
    }
    logging::debug("Clear signal handled",
                   {kv("session_id", session->id()), kv("turn_id", signal.turn_id),
                    kv("reason", signal.reason)});
}

void Orchestrator::connect_recognizer(const std::shared_ptr<session::Session>& session) {
    if (!components_.recognizer) {
        return;
    }
    std::weak_ptr<session::Session> weak = session;
    spawn("recognizer", [this, weak]() {
        auto session = weak.lock();
        if (!session || session->is_closed()) {
            return;
        }
        const auto session_id = session->id();
        auto message_bus = components_.bus;
        try {
            auto stream = components_.recognizer->open(
                session_id,
                [message_bus, session_id](const std::string& text, bool is_final, bool speech_final) {
                    bus::TranscriptEvent event{session_id, text, is_final, speech_final,
                                               bus::now_ms()};
                    message_bus->publish(bus::queues::kTranscription, event);
                });
            session->attach_recognition(std::move(stream));
        } catch (const ProviderError& ex) {
            logging::error("Speech recognizer unavailable for session",
                           {kv("session_id", session_id), kv("error", ex.what())});
        }
    });
}

void Orchestrator::speak_greeting(const std::shared_ptr<session::Session>& session) {
    std::weak_ptr<session::Session> weak = session;
    const auto delay = std::chrono::duration<double>(config_.greeting_delay_sec);
    spawn("greeting", [this, weak, delay]() {
        if (delay.count() > 0.0) {
            std::unique_lock<std::mutex> lock(tasks_mutex_);
            if (tasks_cv_.wait_for(lock, delay, [this]() { return shut_down_; })) {
                return;
            }
        }
        auto session = weak.lock();
        if (!session || session->is_closed()) {
            return;
        }
        // The caller may have spoken first; then the greeting is skipped.
        const auto ticket = session->begin_turn_if_first();
        if (!ticket) {
            return;
        }
        publish_sentence(*session, ticket->turn_id, config_.greeting_text);
        session->release_turn(ticket->turn_id);
    });
}

void Orchestrator::spawn(const std::string& name, std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        if (shut_down_) {
            return;
        }
        ++running_tasks_;
    }
    utils::run_async(
        [this, name, task = std::move(task)]() {
            try {
                task();
            } catch (const std::exception& ex) {
                logging::error("Pipeline task failed", {kv("task", name), kv("error", ex.what())});
            }
            finish_task();
        },
        name);
}

void Orchestrator::finish_task() {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        --running_tasks_;
    }
    tasks_cv_.notify_all();
}

}

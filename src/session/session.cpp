#include "clinic_voice/session/session.hpp"

#include <exception>

#include "clinic_voice/logging.hpp"

namespace clinic_voice::session {

Session::Session(SessionInfo info,
                 const Config& config,
                 std::shared_ptr<playback::AudioSink> sink,
                 std::shared_ptr<providers::SpeechSynthesizer> synthesizer,
                 SynthesisQueue::AudioHandler on_audio)
    : info_(std::move(info)),
      history_(config.system_prompt, static_cast<size_t>(config.history_max_messages)),
      barge_in_(interrupt::BargeInThresholds::from_config(config)) {
    scheduler_ = std::make_unique<playback::PlaybackScheduler>(
        std::move(sink), playback::SchedulerOptions::from_config(config), info_.id);
    synthesis_ = std::make_unique<SynthesisQueue>(info_.id, std::move(synthesizer),
                                                  std::move(on_audio));
}

Session::~Session() {
    close();
}

const std::string& Session::id() const {
    return info_.id;
}

const std::string& Session::call_sid() const {
    return info_.call_sid;
}

const std::string& Session::stream_sid() const {
    return info_.stream_sid;
}

reply::ConversationHistory& Session::history() {
    return history_;
}

playback::PlaybackScheduler& Session::scheduler() {
    return *scheduler_;
}

SynthesisQueue& Session::synthesis() {
    return *synthesis_;
}

interrupt::BargeInDetector& Session::barge_in() {
    return barge_in_;
}

void Session::attach_recognition(std::unique_ptr<providers::RecognitionStream> stream) {
    std::lock_guard<std::mutex> lock(recognition_mutex_);
    if (closed_) {
        if (stream) {
            stream->close();
        }
        return;
    }
    recognition_ = std::move(stream);
}

void Session::send_caller_audio(const audio::Pcm16& pcm) {
    std::lock_guard<std::mutex> lock(recognition_mutex_);
    if (!recognition_ || pcm.empty()) {
        return;
    }
    recognition_->send_audio(pcm);
}

Session::TurnTicket Session::begin_turn() {
    std::lock_guard<std::mutex> lock(turn_mutex_);
    return begin_turn_locked();
}

std::optional<Session::TurnTicket> Session::begin_turn_if_first() {
    std::lock_guard<std::mutex> lock(turn_mutex_);
    if (latest_turn_ != 0) {
        return std::nullopt;
    }
    return begin_turn_locked();
}

Session::TurnTicket Session::begin_turn_locked() {
    utils::cancel(active_cancel_);
    TurnTicket ticket;
    ticket.turn_id = ++latest_turn_;
    ticket.cancel = utils::make_cancel_flag();
    active_turn_ = ticket.turn_id;
    active_cancel_ = ticket.cancel;
    turn_started_at_[ticket.turn_id] = std::chrono::steady_clock::now();
    while (turn_started_at_.size() > 8) {
        turn_started_at_.erase(turn_started_at_.begin());
    }
    return ticket;
}

void Session::release_turn(uint64_t turn_id) {
    std::lock_guard<std::mutex> lock(turn_mutex_);
    if (active_turn_ && *active_turn_ == turn_id) {
        active_turn_.reset();
        active_cancel_.reset();
    }
}

std::optional<uint64_t> Session::active_turn() const {
    std::lock_guard<std::mutex> lock(turn_mutex_);
    return active_turn_;
}

std::optional<Session::TurnTicket> Session::ticket_for(uint64_t turn_id) const {
    std::lock_guard<std::mutex> lock(turn_mutex_);
    if (!active_turn_ || *active_turn_ != turn_id) {
        return std::nullopt;
    }
    return TurnTicket{turn_id, active_cancel_};
}

uint64_t Session::latest_turn() const {
    std::lock_guard<std::mutex> lock(turn_mutex_);
    return latest_turn_;
}

uint64_t Session::next_utterance_id() {
    return ++utterance_counter_;
}

std::unique_lock<std::mutex> Session::lock_generation() {
    return std::unique_lock<std::mutex>(generation_mutex_);
}

uint64_t Session::interrupt() {
    uint64_t turn_id = 0;
    {
        std::lock_guard<std::mutex> lock(turn_mutex_);
        utils::cancel(active_cancel_);
        turn_id = latest_turn_;
    }
    synthesis_->cancel_through(turn_id);
    scheduler_->cancel_through(turn_id);
    return turn_id;
}

bool Session::is_speaking() const {
    {
        std::lock_guard<std::mutex> lock(turn_mutex_);
        if (active_turn_) {
            return true;
        }
    }
    return synthesis_->is_busy() || scheduler_->is_playing();
}

std::optional<double> Session::take_first_audio_latency(uint64_t turn_id) {
    std::lock_guard<std::mutex> lock(turn_mutex_);
    auto it = turn_started_at_.find(turn_id);
    if (it == turn_started_at_.end()) {
        return std::nullopt;
    }
    const auto elapsed = std::chrono::steady_clock::now() - it->second;
    turn_started_at_.erase(it);
    return std::chrono::duration<double>(elapsed).count();
}

void Session::close() {
    if (closed_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(turn_mutex_);
        utils::cancel(active_cancel_);
        active_turn_.reset();
    }
    std::unique_ptr<providers::RecognitionStream> recognition;
    {
        std::lock_guard<std::mutex> lock(recognition_mutex_);
        recognition = std::move(recognition_);
    }
    if (recognition) {
        try {
            recognition->close();
        } catch (const std::exception& ex) {
            logging::warn("Failed to close recognition stream",
                          {kv("session_id", info_.id), kv("error", ex.what())});
        }
    }
    synthesis_->stop();
    scheduler_->stop();
    logging::info("Session closed", {kv("session_id", info_.id), kv("call_sid", info_.call_sid)});
}

bool Session::is_closed() const {
    return closed_;
}

}

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "clinic_voice/config.hpp"
#include "clinic_voice/interrupt/barge_in.hpp"
#include "clinic_voice/playback/scheduler.hpp"
#include "clinic_voice/providers/speech.hpp"
#include "clinic_voice/reply/history.hpp"
#include "clinic_voice/session/synthesis_queue.hpp"
#include "clinic_voice/utils/cancel.hpp"

namespace clinic_voice {
namespace session {

struct SessionInfo {
    std::string id;
    std::string call_sid;
    std::string stream_sid;
};

// State owned by one phone call. close() releases the recognition stream,
// synthesis worker and playback worker exactly once.
class Session {
public:
    struct TurnTicket {
        uint64_t turn_id = 0;
        utils::CancelFlag cancel;
    };

    Session(SessionInfo info,
            const Config& config,
            std::shared_ptr<playback::AudioSink> sink,
            std::shared_ptr<providers::SpeechSynthesizer> synthesizer,
            SynthesisQueue::AudioHandler on_audio);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const;
    const std::string& call_sid() const;
    const std::string& stream_sid() const;

    reply::ConversationHistory& history();
    playback::PlaybackScheduler& scheduler();
    SynthesisQueue& synthesis();
    interrupt::BargeInDetector& barge_in();

    void attach_recognition(std::unique_ptr<providers::RecognitionStream> stream);
    void send_caller_audio(const audio::Pcm16& pcm);

    // Allocates the next turn, cancels whatever generation holds the slot and
    // takes it over.
    TurnTicket begin_turn();
    // Same as begin_turn, but only while no turn has ever been allocated.
    std::optional<TurnTicket> begin_turn_if_first();
    // Frees the slot if the turn still owns it.
    void release_turn(uint64_t turn_id);
    std::optional<uint64_t> active_turn() const;
    // Ticket of the turn holding the slot, if it is turn_id.
    std::optional<TurnTicket> ticket_for(uint64_t turn_id) const;
    uint64_t latest_turn() const;
    uint64_t next_utterance_id();

    // Held for the whole of a turn's routing and generation. A superseded
    // turn keeps it until its provider call has unwound.
    std::unique_lock<std::mutex> lock_generation();

    // Cancels generation, synthesis and playback up to the latest turn.
    uint64_t interrupt();
    bool is_speaking() const;

    // Seconds from turn start to its first audio; reported once per turn.
    std::optional<double> take_first_audio_latency(uint64_t turn_id);

    void close();
    bool is_closed() const;

private:
    TurnTicket begin_turn_locked();

    SessionInfo info_;
    reply::ConversationHistory history_;
    interrupt::BargeInDetector barge_in_;
    std::unique_ptr<playback::PlaybackScheduler> scheduler_;
    std::unique_ptr<SynthesisQueue> synthesis_;

    std::mutex recognition_mutex_;
    std::unique_ptr<providers::RecognitionStream> recognition_;

    std::mutex generation_mutex_;
    mutable std::mutex turn_mutex_;
    uint64_t latest_turn_ = 0;
    std::optional<uint64_t> active_turn_;
    utils::CancelFlag active_cancel_;
    std::map<uint64_t, std::chrono::steady_clock::time_point> turn_started_at_;

    std::atomic<uint64_t> utterance_counter_{0};
    std::atomic<bool> closed_{false};
};

}
}

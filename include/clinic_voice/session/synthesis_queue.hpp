#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "clinic_voice/bus/messages.hpp"
#include "clinic_voice/providers/speech.hpp"
#include "clinic_voice/utils/cancel.hpp"

namespace clinic_voice {
namespace session {

// Per-session FIFO of sentences to synthesize, one at a time. Every request
// that reaches the synthesizer is followed by an end marker.
class SynthesisQueue {
public:
    using AudioHandler = std::function<void(const bus::AudioChunk& chunk)>;

    SynthesisQueue(std::string session_id,
                   std::shared_ptr<providers::SpeechSynthesizer> synthesizer,
                   AudioHandler on_audio);
    ~SynthesisQueue();

    SynthesisQueue(const SynthesisQueue&) = delete;
    SynthesisQueue& operator=(const SynthesisQueue&) = delete;

    void enqueue(bus::SynthesisRequest request);
    void cancel_through(uint64_t turn_id);
    bool is_busy() const;
    void stop();

private:
    void worker_loop();
    void synthesize(const bus::SynthesisRequest& request, const utils::CancelFlag& cancel);

    std::string session_id_;
    std::shared_ptr<providers::SpeechSynthesizer> synthesizer_;
    AudioHandler on_audio_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<bus::SynthesisRequest> queue_;
    std::optional<uint64_t> cleared_through_;
    std::optional<uint64_t> current_turn_;
    utils::CancelFlag current_cancel_;
    bool stopping_ = false;
    std::thread worker_;
};

}
}

#include "clinic_voice/session/synthesis_queue.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iterator>

#include "clinic_voice/errors.hpp"
#include "clinic_voice/logging.hpp"
#include "clinic_voice/metrics.hpp"

namespace clinic_voice::session {

SynthesisQueue::SynthesisQueue(std::string session_id,
                               std::shared_ptr<providers::SpeechSynthesizer> synthesizer,
                               AudioHandler on_audio)
    : session_id_(std::move(session_id)),
      synthesizer_(std::move(synthesizer)),
      on_audio_(std::move(on_audio)) {
    worker_ = std::thread([this]() { worker_loop(); });
}

SynthesisQueue::~SynthesisQueue() {
    stop();
}

void SynthesisQueue::enqueue(bus::SynthesisRequest request) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        if (cleared_through_ && request.turn_id <= *cleared_through_) {
            logging::debug("Skipping synthesis for cancelled turn",
                           {kv("session_id", session_id_), kv("turn_id", request.turn_id)});
            return;
        }
        queue_.push_back(std::move(request));
    }
    cv_.notify_one();
}

void SynthesisQueue::cancel_through(uint64_t turn_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    cleared_through_ = cleared_through_ ? std::max(*cleared_through_, turn_id) : turn_id;
    for (auto it = queue_.begin(); it != queue_.end();) {
        it = it->turn_id <= turn_id ? queue_.erase(it) : std::next(it);
    }
    if (current_turn_ && *current_turn_ <= turn_id) {
        utils::cancel(current_cancel_);
    }
}

bool SynthesisQueue::is_busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_turn_.has_value() || !queue_.empty();
}

void SynthesisQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        queue_.clear();
        utils::cancel(current_cancel_);
    }
    cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void SynthesisQueue::worker_loop() {
    while (true) {
        bus::SynthesisRequest request;
        utils::CancelFlag cancel;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                break;
            }
            request = std::move(queue_.front());
            queue_.pop_front();
            cancel = utils::make_cancel_flag();
            current_cancel_ = cancel;
            current_turn_ = request.turn_id;
        }
        synthesize(request, cancel);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            current_turn_.reset();
            current_cancel_.reset();
        }
    }
}

void SynthesisQueue::synthesize(const bus::SynthesisRequest& request,
                                const utils::CancelFlag& cancel) {
    bus::AudioChunk chunk;
    chunk.session_id = request.session_id;
    chunk.turn_id = request.turn_id;
    chunk.utterance_id = request.utterance_id;

    const auto started = std::chrono::steady_clock::now();
    size_t bytes = 0;
    try {
        synthesizer_->synthesize(request.text, cancel, [&](const audio::UlawBytes& data) {
            if (utils::is_cancelled(cancel) || data.empty()) {
                return;
            }
            bytes += data.size();
            chunk.payload = audio::encode_payload(data);
            on_audio_(chunk);
        });
    } catch (const ProviderError& ex) {
        logging::error("Speech synthesis failed",
                       {kv("session_id", session_id_), kv("turn_id", request.turn_id),
                        kv("utterance_id", request.utterance_id), kv("error", ex.what())});
    } catch (const std::exception& ex) {
        logging::error("Speech synthesis raised unexpected error",
                       {kv("session_id", session_id_), kv("turn_id", request.turn_id),
                        kv("error", ex.what())});
    }
    Metrics::instance().observe_provider_call(
        "speech_synthesizer",
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());

    chunk.payload.clear();
    chunk.end = true;
    try {
        on_audio_(chunk);
    } catch (const std::exception& ex) {
        logging::error("Failed to publish end of utterance",
                       {kv("session_id", session_id_), kv("error", ex.what())});
    }
    logging::debug("Utterance synthesized",
                   {kv("session_id", session_id_), kv("turn_id", request.turn_id),
                    kv("utterance_id", request.utterance_id), kv("bytes", bytes),
                    kv("cancelled", utils::is_cancelled(cancel))});
}

}

#pragma once

#include <condition_variable>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace clinic_voice {
namespace bus {

namespace queues {
inline const std::string kTranscription = "transcription_queue";
inline const std::string kGenerationRequest = "llm_request_queue";
inline const std::string kSynthesisRequest = "tts_request_queue";
inline const std::string kAudioOutput = "audio_output_queue";
inline const std::string kClearAudio = "clear_audio_queue";
}

// Named FIFO queues with a single consumer each. A handler that returns
// acknowledges the message; a handler that throws rejects it without requeue.
class MessageBus {
public:
    using Handler = std::function<void(const nlohmann::json&)>;

    virtual ~MessageBus() = default;

    virtual void publish(const std::string& queue, const nlohmann::json& message) = 0;
    virtual void consume(const std::string& queue, Handler handler) = 0;
    virtual void close() = 0;
};

// In-process bus with one worker thread per consumed queue. Messages published
// before a consumer is registered are held until it is.
class LocalBus : public MessageBus {
public:
    LocalBus() = default;
    ~LocalBus() override;

    LocalBus(const LocalBus&) = delete;
    LocalBus& operator=(const LocalBus&) = delete;

    void publish(const std::string& queue, const nlohmann::json& message) override;
    void consume(const std::string& queue, Handler handler) override;
    void close() override;

    // Waits until every queue is drained and no handler is running.
    bool wait_idle(std::chrono::milliseconds timeout);
    size_t pending(const std::string& queue) const;

private:
    struct Queue {
        std::deque<nlohmann::json> messages;
        Handler handler;
        std::thread worker;
        bool busy = false;
    };

    void worker_loop(const std::string& name, Queue& queue);
    bool idle_locked() const;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::map<std::string, std::unique_ptr<Queue>> queues_;
    bool closed_ = false;
};

}
}

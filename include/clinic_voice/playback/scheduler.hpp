#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "clinic_voice/config.hpp"

namespace clinic_voice {
namespace playback {

// Carrier side of the playback path. Calls are made from the scheduler worker
// or from cancel_through, never concurrently.
class AudioSink {
public:
    virtual ~AudioSink() = default;

    virtual void send_audio(const std::vector<uint8_t>& chunk) = 0;
    virtual void send_clear() = 0;
    virtual void send_mark(const std::string& name) = 0;
};

struct SchedulerOptions {
    int sample_rate = 8000;
    int chunk_ms = 20;
    int lead_chunks = 3;
    int high_water = 25;
    int short_utterance_ms = 500;
    int prebuffer_ms = 40;

    static SchedulerOptions from_config(const Config& config);
};

class PlaybackScheduler {
public:
    using Clock = std::chrono::steady_clock;

    PlaybackScheduler(std::shared_ptr<AudioSink> sink,
                      SchedulerOptions options,
                      std::string session_id);
    ~PlaybackScheduler();

    PlaybackScheduler(const PlaybackScheduler&) = delete;
    PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

    // Returns false when the turn has already been cancelled or the scheduler stopped.
    bool append(uint64_t turn_id, uint64_t utterance_id, const std::vector<uint8_t>& bytes);
    void finish(uint64_t turn_id, uint64_t utterance_id);

    // Drops every utterance of turns up to and including turn_id and clears the carrier.
    void cancel_through(uint64_t turn_id);

    // True while audio is queued or the carrier still has unplayed chunks.
    bool is_playing() const;
    std::optional<uint64_t> cleared_through() const;
    size_t in_flight() const;
    size_t chunk_bytes() const;

    void stop();

private:
    struct Utterance {
        uint64_t turn_id = 0;
        uint64_t utterance_id = 0;
        std::vector<uint8_t> data;
        size_t offset = 0;
        size_t total_bytes = 0;
        bool finished = false;
        bool started = false;
        int chunks_sent = 0;
        Clock::time_point first_byte_at;

        size_t pending() const { return data.size() - offset; }
    };

    void worker_loop();
    std::optional<Clock::time_point> pump(Clock::time_point now);
    void send_chunk(Utterance& utterance, Clock::time_point now);
    size_t in_flight_locked(Clock::time_point now) const;
    Utterance* find_utterance(uint64_t turn_id, uint64_t utterance_id);

    std::shared_ptr<AudioSink> sink_;
    SchedulerOptions options_;
    std::string session_id_;
    size_t chunk_bytes_;
    size_t short_utterance_bytes_;
    Clock::duration chunk_interval_;
    Clock::duration prebuffer_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Utterance> queue_;
    std::optional<uint64_t> cleared_through_;
    Clock::time_point playout_end_;
    Clock::time_point next_send_at_;
    bool stopping_ = false;
    std::thread worker_;
};

}
}

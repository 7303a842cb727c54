#include "clinic_voice/playback/scheduler.hpp"

#include <algorithm>
#include <exception>

#include "clinic_voice/logging.hpp"

namespace clinic_voice::playback {

namespace {

constexpr int kMinChunkMs = 15;
constexpr int kMaxChunkMs = 40;

std::string mark_name(uint64_t turn_id, uint64_t utterance_id) {
    return "turn-" + std::to_string(turn_id) + "-utterance-" + std::to_string(utterance_id);
}

}

SchedulerOptions SchedulerOptions::from_config(const Config& config) {
    SchedulerOptions options;
    options.sample_rate = config.carrier_sample_rate;
    options.chunk_ms = config.playback_chunk_ms;
    options.lead_chunks = config.playback_lead_chunks;
    options.high_water = config.playback_high_water;
    options.short_utterance_ms = config.playback_short_utterance_ms;
    options.prebuffer_ms = config.playback_prebuffer_ms;
    return options;
}

PlaybackScheduler::PlaybackScheduler(std::shared_ptr<AudioSink> sink,
                                     SchedulerOptions options,
                                     std::string session_id)
    : sink_(std::move(sink)),
      options_(options),
      session_id_(std::move(session_id)) {
    options_.chunk_ms = std::clamp(options_.chunk_ms, kMinChunkMs, kMaxChunkMs);
    options_.high_water = std::max(options_.high_water, 1);
    options_.lead_chunks = std::max(options_.lead_chunks, 0);
    // mu-law carries one byte per sample.
    chunk_bytes_ = static_cast<size_t>(options_.sample_rate) * options_.chunk_ms / 1000;
    short_utterance_bytes_ =
        static_cast<size_t>(options_.sample_rate) * std::max(options_.short_utterance_ms, 0) / 1000;
    chunk_interval_ = std::chrono::milliseconds(options_.chunk_ms);
    prebuffer_ = std::chrono::milliseconds(std::max(options_.prebuffer_ms, 0));
    playout_end_ = Clock::now();
    next_send_at_ = playout_end_;
    worker_ = std::thread([this]() { worker_loop(); });
}

PlaybackScheduler::~PlaybackScheduler() {
    stop();
}

bool PlaybackScheduler::append(uint64_t turn_id,
                               uint64_t utterance_id,
                               const std::vector<uint8_t>& bytes) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        if (cleared_through_ && turn_id <= *cleared_through_) {
            logging::debug("Rejecting audio for cancelled turn",
                           {kv("session_id", session_id_), kv("turn_id", turn_id),
                            kv("utterance_id", utterance_id)});
            return false;
        }
        auto* utterance = find_utterance(turn_id, utterance_id);
        if (!utterance) {
            Utterance created;
            created.turn_id = turn_id;
            created.utterance_id = utterance_id;
            created.first_byte_at = Clock::now();
            queue_.push_back(std::move(created));
            utterance = &queue_.back();
        }
        if (utterance->finished) {
            logging::warn("Audio appended after utterance end",
                          {kv("session_id", session_id_), kv("turn_id", turn_id),
                           kv("utterance_id", utterance_id)});
            return false;
        }
        utterance->data.insert(utterance->data.end(), bytes.begin(), bytes.end());
        utterance->total_bytes += bytes.size();
    }
    cv_.notify_one();
    return true;
}

void PlaybackScheduler::finish(uint64_t turn_id, uint64_t utterance_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* utterance = find_utterance(turn_id, utterance_id);
        if (!utterance) {
            return;
        }
        utterance->finished = true;
    }
    cv_.notify_one();
}

void PlaybackScheduler::cancel_through(uint64_t turn_id) {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cleared_through_ = cleared_through_ ? std::max(*cleared_through_, turn_id) : turn_id;
        const auto before = queue_.size();
        queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                    [turn_id](const Utterance& item) {
                                        return item.turn_id <= turn_id;
                                    }),
                     queue_.end());
        dropped = before - queue_.size();
        const auto now = Clock::now();
        playout_end_ = now;
        next_send_at_ = now;
        try {
            sink_->send_clear();
        } catch (const std::exception& ex) {
            logging::error("Failed to send clear",
                           {kv("session_id", session_id_), kv("error", ex.what())});
        }
    }
    cv_.notify_one();
    logging::info("Playback cancelled",
                  {kv("session_id", session_id_), kv("through_turn", turn_id),
                   kv("dropped_utterances", dropped)});
}

bool PlaybackScheduler::is_playing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !queue_.empty() || playout_end_ > Clock::now();
}

std::optional<uint64_t> PlaybackScheduler::cleared_through() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cleared_through_;
}

size_t PlaybackScheduler::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_locked(Clock::now());
}

size_t PlaybackScheduler::chunk_bytes() const {
    return chunk_bytes_;
}

void PlaybackScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        queue_.clear();
    }
    cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void PlaybackScheduler::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        std::optional<Clock::time_point> wake_at;
        try {
            wake_at = pump(Clock::now());
        } catch (const std::exception& ex) {
            logging::error("Playback send failed, dropping utterance",
                           {kv("session_id", session_id_), kv("error", ex.what())});
            if (!queue_.empty()) {
                queue_.pop_front();
            }
            continue;
        }
        if (stopping_) {
            break;
        }
        if (wake_at) {
            cv_.wait_until(lock, *wake_at);
        } else {
            cv_.wait(lock);
        }
    }
}

// Sends whatever is due. Returns the next deadline, or nullopt to wait for input.
std::optional<PlaybackScheduler::Clock::time_point> PlaybackScheduler::pump(
    Clock::time_point now) {
    while (!queue_.empty()) {
        auto& utterance = queue_.front();
        if (utterance.pending() == 0) {
            if (!utterance.finished) {
                return std::nullopt;
            }
            sink_->send_mark(mark_name(utterance.turn_id, utterance.utterance_id));
            logging::debug("Utterance played",
                           {kv("session_id", session_id_), kv("turn_id", utterance.turn_id),
                            kv("utterance_id", utterance.utterance_id),
                            kv("bytes", utterance.total_bytes),
                            kv("chunks", utterance.chunks_sent)});
            queue_.pop_front();
            continue;
        }
        if (!utterance.started) {
            if (utterance.total_bytes < short_utterance_bytes_) {
                const auto start_at = utterance.first_byte_at + prebuffer_;
                if (now < start_at) {
                    return start_at;
                }
            }
            utterance.started = true;
        }
        if (utterance.pending() < chunk_bytes_ && !utterance.finished) {
            return std::nullopt;
        }
        if (now < next_send_at_) {
            return next_send_at_;
        }
        send_chunk(utterance, now);
    }
    return std::nullopt;
}

void PlaybackScheduler::send_chunk(Utterance& utterance, Clock::time_point now) {
    const auto size = std::min(chunk_bytes_, utterance.pending());
    const auto begin = utterance.data.begin() + static_cast<std::ptrdiff_t>(utterance.offset);
    std::vector<uint8_t> chunk(begin, begin + static_cast<std::ptrdiff_t>(size));
    sink_->send_audio(chunk);
    utterance.offset += size;
    utterance.chunks_sent += 1;

    const auto duration = chunk_interval_ * static_cast<long>(size) /
                          static_cast<long>(chunk_bytes_);
    playout_end_ = std::max(playout_end_, now) + duration;

    if (utterance.chunks_sent < options_.lead_chunks) {
        next_send_at_ = now;
        return;
    }
    Clock::duration delay = chunk_interval_;
    const auto in_flight = in_flight_locked(now);
    const auto high_water = static_cast<size_t>(options_.high_water);
    if (in_flight > high_water) {
        const double factor = 1.0 + static_cast<double>(in_flight - high_water) /
                                        static_cast<double>(high_water);
        delay = std::chrono::duration_cast<Clock::duration>(chunk_interval_ * factor);
        logging::debug("Playback backpressure",
                       {kv("session_id", session_id_), kv("in_flight", in_flight),
                        kv("delay_factor", factor)});
    }
    next_send_at_ = now + delay;
}

size_t PlaybackScheduler::in_flight_locked(Clock::time_point now) const {
    if (playout_end_ <= now) {
        return 0;
    }
    const auto remaining = playout_end_ - now;
    return static_cast<size_t>((remaining + chunk_interval_ - Clock::duration(1)) /
                               chunk_interval_);
}

PlaybackScheduler::Utterance* PlaybackScheduler::find_utterance(uint64_t turn_id,
                                                                uint64_t utterance_id) {
    for (auto& utterance : queue_) {
        if (utterance.turn_id == turn_id && utterance.utterance_id == utterance_id) {
            return &utterance;
        }
    }
    return nullptr;
}

}

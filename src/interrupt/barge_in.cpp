#include "clinic_voice/interrupt/barge_in.hpp"

#include "clinic_voice/logging.hpp"
#include "clinic_voice/utils/text.hpp"

namespace clinic_voice::interrupt {

BargeInThresholds BargeInThresholds::from_config(const Config& config) {
    BargeInThresholds thresholds;
    thresholds.min_words = static_cast<size_t>(config.barge_in_min_words);
    thresholds.min_speech = std::chrono::milliseconds(config.barge_in_min_speech_ms);
    thresholds.min_chars = static_cast<size_t>(config.barge_in_min_chars);
    thresholds.cooldown = std::chrono::milliseconds(config.barge_in_cooldown_ms);
    return thresholds;
}

BargeInDetector::BargeInDetector(BargeInThresholds thresholds)
    : thresholds_(thresholds) {}

bool BargeInDetector::on_interim(const std::string& text, Clock::time_point now) {
    const auto cleaned = utils::trim(text);
    if (cleaned.empty()) {
        return false;
    }
    if (state_ == BargeInState::triggered) {
        if (last_trigger_at_ && now - *last_trigger_at_ <= thresholds_.cooldown) {
            return false;
        }
        state_ = BargeInState::idle;
    }
    if (state_ == BargeInState::idle) {
        state_ = BargeInState::listening;
        speech_started_at_ = now;
    }

    const auto words = utils::count_words(cleaned);
    const auto speech = now - speech_started_at_;
    const bool enough_speech = words >= thresholds_.min_words ||
                               speech > thresholds_.min_speech ||
                               cleaned.size() >= thresholds_.min_chars;
    if (!enough_speech) {
        return false;
    }
    if (last_trigger_at_ && now - *last_trigger_at_ <= thresholds_.cooldown) {
        return false;
    }
    state_ = BargeInState::triggered;
    last_trigger_at_ = now;
    logging::debug("Barge-in detected",
                   {kv("words", words),
                    kv("speech_ms",
                       std::chrono::duration_cast<std::chrono::milliseconds>(speech).count()),
                    kv("text", cleaned)});
    return true;
}

void BargeInDetector::on_final() {
    state_ = BargeInState::idle;
}

void BargeInDetector::reset() {
    state_ = BargeInState::idle;
    last_trigger_at_.reset();
}

BargeInState BargeInDetector::state() const {
    return state_;
}

std::string to_string(BargeInState state) {
    switch (state) {
        case BargeInState::idle: return "idle";
        case BargeInState::listening: return "listening";
        case BargeInState::triggered: return "triggered";
    }
    return "idle";
}

}

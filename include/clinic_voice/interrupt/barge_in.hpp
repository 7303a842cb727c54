#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "clinic_voice/config.hpp"

namespace clinic_voice {
namespace interrupt {

using Clock = std::chrono::steady_clock;

struct BargeInThresholds {
    size_t min_words = 2;
    std::chrono::milliseconds min_speech{150};
    size_t min_chars = 5;
    std::chrono::milliseconds cooldown{500};

    static BargeInThresholds from_config(const Config& config);
};

enum class BargeInState { idle, listening, triggered };

// Decides from interim transcripts whether the caller is talking over the
// agent. Not thread safe; one transcript consumer drives it.
class BargeInDetector {
public:
    explicit BargeInDetector(BargeInThresholds thresholds = {});

    // Returns true when this interim transcript triggers a barge-in.
    bool on_interim(const std::string& text, Clock::time_point now);
    // Final transcript or end of speech; always returns to idle.
    void on_final();
    // Forgets any trigger, including the cooldown it started.
    void reset();

    BargeInState state() const;

private:
    BargeInThresholds thresholds_;
    BargeInState state_ = BargeInState::idle;
    Clock::time_point speech_started_at_;
    std::optional<Clock::time_point> last_trigger_at_;
};

std::string to_string(BargeInState state);

}
}

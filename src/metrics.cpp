#include "clinic_voice/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace clinic_voice {

namespace {

template <typename Map>
std::vector<std::string> sorted_keys(const Map& items) {
    std::vector<std::string> keys;
    keys.reserve(items.size());
    for (const auto& item : items) {
        keys.push_back(item.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

}

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 0.75,
                         1.0, 1.5, 2.0, 3.0, 5.0, 10.0};
}

void Metrics::increment_turn(const std::string& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++turns_by_outcome_[outcome];
}

void Metrics::increment_interruption() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++interruptions_total_;
}

void Metrics::increment_dropped_message(const std::string& queue) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++dropped_by_queue_[queue];
}

void Metrics::set_active_sessions(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_sessions_ = count;
}

Metrics::HistogramSeries& Metrics::histogram_for(const std::string& stage) {
    auto& series = latency_histograms_[stage];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    return series;
}

void Metrics::observe_latency(const std::string& stage, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histogram_for(stage);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

void Metrics::observe_provider_call(const std::string& provider, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& summary = provider_summaries_[provider];
    summary.count += 1;
    summary.sum += seconds;
}

uint64_t Metrics::turn_count(const std::string& outcome) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = turns_by_outcome_.find(outcome);
    return it == turns_by_outcome_.end() ? 0 : it->second;
}

uint64_t Metrics::interruption_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interruptions_total_;
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    turns_by_outcome_.clear();
    dropped_by_queue_.clear();
    interruptions_total_ = 0;
    active_sessions_ = 0;
    provider_summaries_.clear();
    latency_histograms_.clear();
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP clinic_voice_active_sessions Calls currently connected\n";
    out << "# TYPE clinic_voice_active_sessions gauge\n";
    out << "clinic_voice_active_sessions " << active_sessions_ << "\n";

    out << "# HELP clinic_voice_turns_total Finalized caller turns by outcome\n";
    out << "# TYPE clinic_voice_turns_total counter\n";
    for (const auto& outcome : sorted_keys(turns_by_outcome_)) {
        out << "clinic_voice_turns_total{outcome=\"" << outcome << "\"} "
            << turns_by_outcome_.at(outcome) << "\n";
    }

    out << "# HELP clinic_voice_interruptions_total Caller barge-ins that cut playback\n";
    out << "# TYPE clinic_voice_interruptions_total counter\n";
    out << "clinic_voice_interruptions_total " << interruptions_total_ << "\n";

    out << "# HELP clinic_voice_dropped_messages_total Bus messages dropped after a handler error\n";
    out << "# TYPE clinic_voice_dropped_messages_total counter\n";
    for (const auto& queue : sorted_keys(dropped_by_queue_)) {
        out << "clinic_voice_dropped_messages_total{queue=\"" << queue << "\"} "
            << dropped_by_queue_.at(queue) << "\n";
    }

    out << "# HELP clinic_voice_provider_call_seconds Time spent in provider calls\n";
    out << "# TYPE clinic_voice_provider_call_seconds summary\n";
    for (const auto& provider : sorted_keys(provider_summaries_)) {
        const auto& series = provider_summaries_.at(provider);
        out << "clinic_voice_provider_call_seconds_count{provider=\"" << provider << "\"} "
            << series.count << "\n";
        out << "clinic_voice_provider_call_seconds_sum{provider=\"" << provider << "\"} "
            << series.sum << "\n";
    }

    out << "# HELP clinic_voice_latency_seconds Turn latency by pipeline stage\n";
    out << "# TYPE clinic_voice_latency_seconds histogram\n";
    for (const auto& stage : sorted_keys(latency_histograms_)) {
        const auto& series = latency_histograms_.at(stage);
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "clinic_voice_latency_seconds_bucket{stage=\"" << stage
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "clinic_voice_latency_seconds_bucket{stage=\"" << stage
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "clinic_voice_latency_seconds_count{stage=\"" << stage << "\"} "
            << series.count << "\n";
        out << "clinic_voice_latency_seconds_sum{stage=\"" << stage << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}

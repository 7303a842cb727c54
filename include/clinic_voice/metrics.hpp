#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace clinic_voice {

class Metrics {
public:
    static Metrics& instance();

    void increment_turn(const std::string& outcome);
    void increment_interruption();
    void increment_dropped_message(const std::string& queue);
    void set_active_sessions(size_t count);

    // Latencies in seconds. Stage is one of route, first_sentence, first_audio.
    void observe_latency(const std::string& stage, double seconds);
    void observe_provider_call(const std::string& provider, double seconds);

    std::string render_prometheus() const;

    uint64_t turn_count(const std::string& outcome) const;
    uint64_t interruption_count() const;

    // Drops every series; intended for tests.
    void reset();

private:
    struct SummarySeries {
        uint64_t count = 0;
        double sum = 0.0;
    };

    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    HistogramSeries& histogram_for(const std::string& stage);

    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> turns_by_outcome_;
    std::map<std::string, uint64_t> dropped_by_queue_;
    uint64_t interruptions_total_ = 0;
    size_t active_sessions_ = 0;
    std::unordered_map<std::string, SummarySeries> provider_summaries_;
    std::unordered_map<std::string, HistogramSeries> latency_histograms_;
    std::vector<double> histogram_bounds_;
};

}

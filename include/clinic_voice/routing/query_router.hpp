#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "clinic_voice/config.hpp"
#include "clinic_voice/routing/knowledge_base.hpp"

namespace clinic_voice {
namespace routing {

enum class ConfidenceTier { high, medium, low, none };
enum class AnswerStrategy { direct, grounded, open };

struct RouterThresholds {
    double min_score = 0.5;
    double mid_score = 0.6;
    double high_score = 0.8;
    int top_k = 3;

    static RouterThresholds from_config(const Config& config);
};

struct RouteDecision {
    ConfidenceTier tier = ConfidenceTier::none;
    AnswerStrategy strategy = AnswerStrategy::open;
    std::optional<std::string> direct_answer;
    // Passages above the minimum score, best first.
    std::vector<Passage> passages;
    std::string context;
    bool retrieval_attempted = false;
};

// Confidence gate between the knowledge base and reply generation.
class QueryRouter {
public:
    QueryRouter(std::shared_ptr<KnowledgeBase> knowledge_base,
                std::vector<std::string> keywords,
                RouterThresholds thresholds);

    RouteDecision route(const std::string& query) const;
    bool is_relevant(const std::string& query) const;

private:
    std::shared_ptr<KnowledgeBase> knowledge_base_;
    std::vector<std::string> keywords_;
    RouterThresholds thresholds_;
};

std::string format_context(const std::vector<Passage>& passages);
std::string to_string(ConfidenceTier tier);
std::string to_string(AnswerStrategy strategy);

}
}

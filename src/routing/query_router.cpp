#include "clinic_voice/routing/query_router.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <exception>

#include "clinic_voice/logging.hpp"
#include "clinic_voice/metrics.hpp"
#include "clinic_voice/utils/text.hpp"

namespace clinic_voice::routing {

namespace {

bool matches_at_word_start(const std::string& text, const std::string& keyword) {
    if (keyword.empty()) {
        return false;
    }
    size_t pos = text.find(keyword);
    while (pos != std::string::npos) {
        if (pos == 0 || !std::isalnum(static_cast<unsigned char>(text[pos - 1]))) {
            return true;
        }
        pos = text.find(keyword, pos + 1);
    }
    return false;
}

}

RouterThresholds RouterThresholds::from_config(const Config& config) {
    RouterThresholds thresholds;
    thresholds.min_score = config.rag_min_score;
    thresholds.mid_score = config.rag_mid_score;
    thresholds.high_score = config.rag_high_score;
    thresholds.top_k = config.rag_top_k;
    return thresholds;
}

QueryRouter::QueryRouter(std::shared_ptr<KnowledgeBase> knowledge_base,
                         std::vector<std::string> keywords,
                         RouterThresholds thresholds)
    : knowledge_base_(std::move(knowledge_base)),
      thresholds_(thresholds) {
    for (auto& keyword : keywords) {
        auto normalized = utils::normalize_text(keyword);
        if (!normalized.empty()) {
            keywords_.push_back(std::move(normalized));
        }
    }
}

bool QueryRouter::is_relevant(const std::string& query) const {
    const auto normalized = utils::normalize_text(query);
    return std::any_of(keywords_.begin(), keywords_.end(), [&](const std::string& keyword) {
        return matches_at_word_start(normalized, keyword);
    });
}

RouteDecision QueryRouter::route(const std::string& query) const {
    RouteDecision decision;
    if (!is_relevant(query)) {
        logging::debug("Query outside clinic domain, skipping retrieval",
                       {kv("query", query)});
        return decision;
    }
    if (!knowledge_base_) {
        logging::warn("Knowledge base unavailable, answering without context");
        return decision;
    }

    decision.retrieval_attempted = true;
    std::vector<Passage> results;
    const auto started = std::chrono::steady_clock::now();
    try {
        results = knowledge_base_->search(query, thresholds_.top_k);
    } catch (const std::exception& ex) {
        logging::warn("Knowledge base search failed, answering without context",
                      {kv("error", ex.what())});
        return decision;
    }
    Metrics::instance().observe_provider_call(
        "knowledge_base",
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());

    std::stable_sort(results.begin(), results.end(),
                     [](const Passage& a, const Passage& b) { return a.score > b.score; });
    for (auto& passage : results) {
        if (passage.score >= thresholds_.min_score) {
            decision.passages.push_back(std::move(passage));
        }
    }
    if (decision.passages.empty()) {
        logging::debug("No passage above minimum score", {kv("query", query)});
        return decision;
    }

    const auto& top = decision.passages.front();
    if (top.score >= thresholds_.high_score && top.kind == PassageKind::curated_qa &&
        top.answer) {
        decision.tier = ConfidenceTier::high;
        decision.strategy = AnswerStrategy::direct;
        decision.direct_answer = top.answer;
    } else if (top.score >= thresholds_.mid_score) {
        decision.tier = ConfidenceTier::medium;
        decision.strategy = AnswerStrategy::grounded;
    } else {
        decision.tier = ConfidenceTier::low;
        decision.strategy = AnswerStrategy::grounded;
    }
    decision.context = format_context(decision.passages);
    logging::debug("Query routed",
                   {kv("tier", to_string(decision.tier)),
                    kv("top_score", top.score),
                    kv("top_kind", to_string(top.kind)),
                    kv("passages", decision.passages.size())});
    return decision;
}

std::string format_context(const std::vector<Passage>& passages) {
    std::string context;
    for (size_t i = 0; i < passages.size(); ++i) {
        if (!context.empty()) {
            context += "\n\n";
        }
        const auto relevance = static_cast<int>(std::lround(passages[i].score * 100.0));
        context += "[Source " + std::to_string(i + 1) + "] (relevance: " +
                   std::to_string(relevance) + "%):\n" + passages[i].text;
    }
    return context;
}

std::string to_string(ConfidenceTier tier) {
    switch (tier) {
        case ConfidenceTier::high: return "high";
        case ConfidenceTier::medium: return "medium";
        case ConfidenceTier::low: return "low";
        case ConfidenceTier::none: return "none";
    }
    return "none";
}

std::string to_string(AnswerStrategy strategy) {
    switch (strategy) {
        case AnswerStrategy::direct: return "direct";
        case AnswerStrategy::grounded: return "grounded";
        case AnswerStrategy::open: return "open";
    }
    return "open";
}

}

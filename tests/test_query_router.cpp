#include <catch2/catch_test_macros.hpp>

#include "clinic_voice/routing/query_router.hpp"

#include "fakes.hpp"

using namespace clinic_voice;
using clinic_voice::testing::FakeKnowledgeBase;
using clinic_voice::testing::make_passage;

namespace {

std::shared_ptr<FakeKnowledgeBase> clinic_corpus() {
    auto kb = std::make_shared<FakeKnowledgeBase>();
    kb->set_results("what are your hours",
                    {make_passage("qa-hours", "Q: What are your hours?", 0.92,
                                  std::string("We are open 9 to 5, Monday through Friday.")),
                     make_passage("doc-1", "Office hours vary on holidays.", 0.71)});
    kb->set_results("do you accept Blue Cross",
                    {make_passage("doc-ins", "We accept Blue Cross, Aetna and Cigna.", 0.65),
                     make_passage("doc-x", "Parking is behind the building.", 0.31)});
    kb->set_results("is there parking near the office",
                    {make_passage("doc-park", "Parking is behind the building.", 0.55)});
    kb->set_results("where is the location",
                    {make_passage("doc-low", "Unrelated text.", 0.2)});
    return kb;
}

routing::QueryRouter make_router(std::shared_ptr<routing::KnowledgeBase> kb,
                                 routing::RouterThresholds thresholds = {}) {
    return routing::QueryRouter(std::move(kb), default_rag_keywords(), thresholds);
}

}

TEST_CASE("a confident curated entry is answered directly") {
    auto kb = clinic_corpus();
    const auto router = make_router(kb);
    const auto decision = router.route("what are your hours");
    REQUIRE(decision.tier == routing::ConfidenceTier::high);
    REQUIRE(decision.strategy == routing::AnswerStrategy::direct);
    REQUIRE(decision.direct_answer.has_value());
    REQUIRE(*decision.direct_answer == "We are open 9 to 5, Monday through Friday.");
    REQUIRE(kb->calls() == 1);
}

TEST_CASE("a moderately similar free-text passage grounds the reply") {
    const auto router = make_router(clinic_corpus());
    const auto decision = router.route("do you accept Blue Cross");
    REQUIRE(decision.tier == routing::ConfidenceTier::medium);
    REQUIRE(decision.strategy == routing::AnswerStrategy::grounded);
    REQUIRE_FALSE(decision.direct_answer.has_value());
    REQUIRE(decision.passages.size() == 1);
    REQUIRE(decision.context ==
            "[Source 1] (relevance: 65%):\nWe accept Blue Cross, Aetna and Cigna.");
}

TEST_CASE("a weak passage still grounds the reply at low confidence") {
    const auto router = make_router(clinic_corpus());
    const auto decision = router.route("is there parking near the office");
    REQUIRE(decision.tier == routing::ConfidenceTier::low);
    REQUIRE(decision.strategy == routing::AnswerStrategy::grounded);
}

TEST_CASE("passages below the minimum score are discarded") {
    const auto router = make_router(clinic_corpus());
    const auto decision = router.route("where is the location");
    REQUIRE(decision.retrieval_attempted);
    REQUIRE(decision.tier == routing::ConfidenceTier::none);
    REQUIRE(decision.strategy == routing::AnswerStrategy::open);
    REQUIRE(decision.passages.empty());
}

TEST_CASE("off-domain questions skip retrieval entirely") {
    auto kb = clinic_corpus();
    const auto router = make_router(kb);
    const auto decision = router.route("tell me a joke");
    REQUIRE_FALSE(decision.retrieval_attempted);
    REQUIRE(decision.strategy == routing::AnswerStrategy::open);
    REQUIRE(kb->calls() == 0);
}

TEST_CASE("keywords only match at the start of a word") {
    const auto router = make_router(clinic_corpus());
    REQUIRE(router.is_relevant("Can I book an APPOINTMENT?"));
    REQUIRE(router.is_relevant("do you take blue   cross"));
    REQUIRE_FALSE(router.is_relevant("I reopened the window"));
}

TEST_CASE("a failing knowledge base degrades to an open answer") {
    auto kb = clinic_corpus();
    kb->fail_with("index offline");
    const auto router = make_router(kb);
    const auto decision = router.route("what are your hours");
    REQUIRE(decision.tier == routing::ConfidenceTier::none);
    REQUIRE(decision.strategy == routing::AnswerStrategy::open);
}

TEST_CASE("no knowledge base means open answers") {
    const auto router = make_router(nullptr);
    const auto decision = router.route("what are your hours");
    REQUIRE(decision.strategy == routing::AnswerStrategy::open);
    REQUIRE_FALSE(decision.retrieval_attempted);
}

TEST_CASE("raising thresholds never adds direct or grounded answers") {
    const std::vector<std::string> queries = {"what are your hours", "do you accept Blue Cross",
                                              "is there parking near the office",
                                              "where is the location", "tell me a joke"};
    const auto count_answers = [&](const routing::RouterThresholds& thresholds) {
        const auto router = make_router(clinic_corpus(), thresholds);
        int direct = 0;
        int grounded = 0;
        for (const auto& query : queries) {
            const auto decision = router.route(query);
            direct += decision.strategy == routing::AnswerStrategy::direct ? 1 : 0;
            grounded += decision.strategy != routing::AnswerStrategy::open ? 1 : 0;
        }
        return std::make_pair(direct, grounded);
    };

    routing::RouterThresholds previous;
    auto previous_counts = count_answers(previous);
    for (double bump = 0.05; bump <= 0.5; bump += 0.05) {
        routing::RouterThresholds raised;
        raised.min_score = previous.min_score + 0.05;
        raised.mid_score = std::max(previous.mid_score + 0.05, raised.min_score);
        raised.high_score = std::max(previous.high_score + 0.05, raised.mid_score);
        const auto counts = count_answers(raised);
        REQUIRE(counts.first <= previous_counts.first);
        REQUIRE(counts.second <= previous_counts.second);
        previous = raised;
        previous_counts = counts;
    }
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "clinic_voice/routing/knowledge_base.hpp"

#include <filesystem>
#include <fstream>

#include "fakes.hpp"

using namespace clinic_voice;
using Catch::Matchers::WithinAbs;

namespace {

nlohmann::json sample_index() {
    return nlohmann::json::parse(R"({
        "passages": [
            {"id": "qa-hours", "text": "Q: What are your hours?",
             "embedding": [1.0, 0.0, 0.0],
             "metadata": {"type": "qa_pair", "answer": "We are open 9 to 5."}},
            {"id": "doc-ins", "text": "We accept Blue Cross.",
             "embedding": [0.0, 1.0, 0.0]},
            {"text": "Parking is behind the building.",
             "embedding": [0.6, 0.8, 0.0]}
        ]
    })");
}

}

TEST_CASE("search ranks passages by cosine similarity") {
    auto embedder = std::make_shared<testing::FakeEmbedder>();
    embedder->set("hours", {2.0f, 0.0f, 0.0f});
    routing::VectorIndex index(embedder);
    index.load_json(sample_index());
    REQUIRE(index.size() == 3);
    REQUIRE(index.dimension() == 3);

    const auto results = index.search("hours", 2);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].id == "qa-hours");
    REQUIRE_THAT(results[0].score, WithinAbs(1.0, 1e-6));
    REQUIRE(results[0].kind == routing::PassageKind::curated_qa);
    REQUIRE(results[0].answer == std::optional<std::string>("We are open 9 to 5."));
    REQUIRE(results[1].id == "2");
    REQUIRE_THAT(results[1].score, WithinAbs(0.6, 1e-6));
    REQUIRE(results[1].kind == routing::PassageKind::free_text);
}

TEST_CASE("plain array documents load too") {
    routing::VectorIndex index(std::make_shared<testing::FakeEmbedder>());
    index.load_json(sample_index()["passages"]);
    REQUIRE(index.size() == 3);
}

TEST_CASE("inconsistent dimensions are rejected") {
    routing::VectorIndex index(std::make_shared<testing::FakeEmbedder>());
    auto document = sample_index();
    document["passages"][1]["embedding"] = {1.0, 2.0};
    REQUIRE_THROWS_AS(index.load_json(document), KnowledgeBaseError);
}

TEST_CASE("missing files and failed embeddings raise knowledge base errors") {
    routing::VectorIndex index(std::make_shared<testing::FakeEmbedder>());
    REQUIRE_THROWS_AS(index.load("/nonexistent/clinic_index.json"), KnowledgeBaseError);
    index.load_json(sample_index());
    REQUIRE_THROWS_AS(index.search("unknown query", 3), KnowledgeBaseError);
}

TEST_CASE("index files load from disk") {
    const auto path = std::filesystem::temp_directory_path() / "clinic_voice_index_test.json";
    {
        std::ofstream out(path);
        out << sample_index().dump();
    }
    auto embedder = std::make_shared<testing::FakeEmbedder>();
    embedder->set("insurance", {0.0f, 1.0f, 0.0f});
    routing::VectorIndex index(embedder);
    index.load(path);
    const auto results = index.search("insurance", 1);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].id == "doc-ins");
    std::filesystem::remove(path);
}

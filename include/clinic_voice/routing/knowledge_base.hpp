#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace clinic_voice {
namespace routing {

enum class PassageKind { curated_qa, free_text };

struct Passage {
    std::string id;
    std::string text;
    double score = 0.0;
    PassageKind kind = PassageKind::free_text;
    // Stored reply of a curated Q&A entry.
    std::optional<std::string> answer;
    nlohmann::json metadata = nlohmann::json::object();
};

// Ranked similarity search. Higher scores are better. Throws KnowledgeBaseError
// when the index cannot answer.
class KnowledgeBase {
public:
    virtual ~KnowledgeBase() = default;

    virtual std::vector<Passage> search(const std::string& query, int k) = 0;
};

class Embedder {
public:
    virtual ~Embedder() = default;

    virtual std::vector<float> embed(const std::string& text) = 0;
};

// Flat cosine-similarity index over precomputed passage embeddings.
//
// The index file is JSON, either an array of entries or an object with a
// "passages" array. Each entry carries "text", "embedding" and optional "id"
// and "metadata"; metadata {"type": "qa_pair", "answer": ...} marks a curated
// entry.
class VectorIndex : public KnowledgeBase {
public:
    explicit VectorIndex(std::shared_ptr<Embedder> embedder);

    void load(const std::filesystem::path& path);
    void load_json(const nlohmann::json& document);
    void add(Passage passage, std::vector<float> embedding);

    std::vector<Passage> search(const std::string& query, int k) override;

    size_t size() const;
    size_t dimension() const;

private:
    struct Entry {
        Passage passage;
        std::vector<float> embedding;
        float norm = 0.0f;
    };

    static Entry make_entry(Passage passage, std::vector<float> embedding);

    std::shared_ptr<Embedder> embedder_;
    mutable std::shared_mutex mutex_;
    std::vector<Entry> entries_;
    size_t dimension_ = 0;
};

PassageKind passage_kind_from_metadata(const nlohmann::json& metadata);
std::string to_string(PassageKind kind);

}
}

#include "clinic_voice/routing/knowledge_base.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <mutex>

#include "clinic_voice/errors.hpp"
#include "clinic_voice/logging.hpp"

namespace clinic_voice::routing {

namespace {

float vector_norm(const std::vector<float>& values) {
    float sum = 0.0f;
    for (auto value : values) {
        sum += value * value;
    }
    return std::sqrt(sum);
}

float cosine_similarity(const std::vector<float>& a, float norm_a,
                        const std::vector<float>& b, float norm_b) {
    const float denom = norm_a * norm_b;
    if (denom < 1e-8f) {
        return 0.0f;
    }
    float dot = 0.0f;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += a[i] * b[i];
    }
    return dot / denom;
}

}

PassageKind passage_kind_from_metadata(const nlohmann::json& metadata) {
    if (metadata.is_object() && metadata.value("type", "") == "qa_pair" &&
        metadata.contains("answer") && metadata["answer"].is_string()) {
        return PassageKind::curated_qa;
    }
    return PassageKind::free_text;
}

std::string to_string(PassageKind kind) {
    return kind == PassageKind::curated_qa ? "curated_qa" : "free_text";
}

VectorIndex::VectorIndex(std::shared_ptr<Embedder> embedder)
    : embedder_(std::move(embedder)) {}

void VectorIndex::load(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        throw KnowledgeBaseError("cannot open knowledge index " + path.string());
    }
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(stream);
    } catch (const nlohmann::json::exception& ex) {
        throw KnowledgeBaseError("invalid knowledge index " + path.string() + ": " + ex.what());
    }
    load_json(document);
    logging::info("Knowledge index loaded",
                  {kv("path", path.string()), kv("passages", size()),
                   kv("dimension", dimension())});
}

void VectorIndex::load_json(const nlohmann::json& document) {
    nlohmann::json items;
    if (document.is_array()) {
        items = document;
    } else if (document.is_object() && document.contains("passages")) {
        items = document["passages"];
    }
    if (!items.is_array()) {
        throw KnowledgeBaseError("knowledge index has no passages array");
    }
    size_t index = 0;
    for (const auto& item : items) {
        try {
            Passage passage;
            if (!item.contains("id")) {
                passage.id = std::to_string(index);
            } else if (item["id"].is_string()) {
                passage.id = item["id"].get<std::string>();
            } else {
                passage.id = item["id"].dump();
            }
            passage.text = item.at("text").get<std::string>();
            passage.metadata = item.value("metadata", nlohmann::json::object());
            passage.kind = passage_kind_from_metadata(passage.metadata);
            if (passage.kind == PassageKind::curated_qa) {
                passage.answer = passage.metadata["answer"].get<std::string>();
            }
            add(std::move(passage), item.at("embedding").get<std::vector<float>>());
        } catch (const nlohmann::json::exception& ex) {
            throw KnowledgeBaseError("invalid passage at index " + std::to_string(index) +
                                     ": " + ex.what());
        }
        ++index;
    }
}

VectorIndex::Entry VectorIndex::make_entry(Passage passage, std::vector<float> embedding) {
    Entry entry;
    entry.norm = vector_norm(embedding);
    entry.passage = std::move(passage);
    entry.embedding = std::move(embedding);
    return entry;
}

void VectorIndex::add(Passage passage, std::vector<float> embedding) {
    if (embedding.empty()) {
        throw KnowledgeBaseError("passage " + passage.id + " has an empty embedding");
    }
    std::unique_lock lock(mutex_);
    if (dimension_ == 0) {
        dimension_ = embedding.size();
    } else if (embedding.size() != dimension_) {
        throw KnowledgeBaseError("passage " + passage.id + " has dimension " +
                                 std::to_string(embedding.size()) + ", expected " +
                                 std::to_string(dimension_));
    }
    entries_.push_back(make_entry(std::move(passage), std::move(embedding)));
}

std::vector<Passage> VectorIndex::search(const std::string& query, int k) {
    if (!embedder_) {
        throw KnowledgeBaseError("no embedder configured");
    }
    std::vector<float> query_vector;
    try {
        query_vector = embedder_->embed(query);
    } catch (const std::exception& ex) {
        throw KnowledgeBaseError(std::string("query embedding failed: ") + ex.what());
    }

    std::shared_lock lock(mutex_);
    if (entries_.empty()) {
        return {};
    }
    if (query_vector.size() != dimension_) {
        throw KnowledgeBaseError("query embedding has dimension " +
                                 std::to_string(query_vector.size()) + ", index has " +
                                 std::to_string(dimension_));
    }
    const float query_norm = vector_norm(query_vector);

    std::vector<std::pair<float, size_t>> scored;
    scored.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        const auto& entry = entries_[i];
        scored.emplace_back(
            cosine_similarity(query_vector, query_norm, entry.embedding, entry.norm), i);
    }
    const auto limit = std::min(scored.size(), static_cast<size_t>(std::max(k, 0)));
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(limit),
                      scored.end(),
                      [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<Passage> results;
    results.reserve(limit);
    for (size_t i = 0; i < limit; ++i) {
        Passage passage = entries_[scored[i].second].passage;
        passage.score = scored[i].first;
        results.push_back(std::move(passage));
    }
    return results;
}

size_t VectorIndex::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

size_t VectorIndex::dimension() const {
    std::shared_lock lock(mutex_);
    return dimension_;
}

}

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clinic_voice/config.hpp"
#include "clinic_voice/providers/http_client.hpp"
#include "clinic_voice/reply/generator.hpp"
#include "clinic_voice/routing/knowledge_base.hpp"

namespace clinic_voice {
namespace providers {

nlohmann::json to_json_messages(const std::vector<reply::ChatMessage>& messages);

// Extracts the text delta from one server-sent event line of an OpenAI-style
// chat completion stream. Sets done on the [DONE] sentinel.
std::optional<std::string> parse_openai_event(const std::string& line, bool& done);

// Extracts the text delta from one NDJSON line of an Ollama chat stream.
std::optional<std::string> parse_ollama_line(const std::string& line, bool& done);

class OpenAiChatGenerator : public reply::ReplyGenerator {
public:
    OpenAiChatGenerator(std::string base_url, std::optional<std::string> api_key,
                        double timeout_sec);

    void generate(const std::vector<reply::ChatMessage>& messages,
                  const reply::GenerationParams& params,
                  const FragmentHandler& on_fragment) override;

private:
    HttpProviderClient client_;
};

class OllamaChatGenerator : public reply::ReplyGenerator {
public:
    OllamaChatGenerator(std::string base_url, double timeout_sec);

    void generate(const std::vector<reply::ChatMessage>& messages,
                  const reply::GenerationParams& params,
                  const FragmentHandler& on_fragment) override;

private:
    HttpProviderClient client_;
};

class OpenAiEmbedder : public routing::Embedder {
public:
    OpenAiEmbedder(std::string base_url, std::optional<std::string> api_key,
                   std::string model, double timeout_sec);

    std::vector<float> embed(const std::string& text) override;

private:
    HttpProviderClient client_;
    std::string model_;
};

std::unique_ptr<reply::ReplyGenerator> make_reply_generator(const Config& config);

}
}

#include "clinic_voice/providers/chat.hpp"

#include <chrono>
#include <utility>

#include "clinic_voice/errors.hpp"
#include "clinic_voice/logging.hpp"
#include "clinic_voice/metrics.hpp"
#include "clinic_voice/utils/text.hpp"

namespace clinic_voice::providers {

namespace {

constexpr const char* kDataPrefix = "data:";

// Parses the streamed body line by line until done or the handler stops.
template <typename Parser>
void stream_lines(HttpProviderClient& client,
                  const std::string& path,
                  const nlohmann::json& body,
                  Parser parse,
                  const reply::ReplyGenerator::FragmentHandler& on_fragment) {
    LineBuffer lines;
    bool done = false;
    const auto handle_line = [&](const std::string& line) {
        auto fragment = parse(line, done);
        if (fragment && !fragment->empty() && !on_fragment(*fragment)) {
            return false;
        }
        return !done;
    };
    const bool finished = client.post_stream(
        path, body, [&](const char* data, size_t size) {
            return lines.feed(data, size, handle_line);
        });
    if (finished && !done) {
        const auto rest = lines.take_rest();
        if (!rest.empty()) {
            handle_line(rest);
        }
    }
}

}

nlohmann::json to_json_messages(const std::vector<reply::ChatMessage>& messages) {
    auto array = nlohmann::json::array();
    for (const auto& message : messages) {
        array.push_back({{"role", message.role}, {"content", message.content}});
    }
    return array;
}

std::optional<std::string> parse_openai_event(const std::string& line, bool& done) {
    const auto trimmed = utils::trim(line);
    if (trimmed.rfind(kDataPrefix, 0) != 0) {
        return std::nullopt;
    }
    const auto payload = utils::trim(trimmed.substr(std::char_traits<char>::length(kDataPrefix)));
    if (payload == "[DONE]") {
        done = true;
        return std::nullopt;
    }
    const auto event = nlohmann::json::parse(payload, nullptr, false);
    if (event.is_discarded()) {
        logging::warn("Ignoring malformed completion event", {kv("payload", payload)});
        return std::nullopt;
    }
    if (event.contains("error")) {
        throw ProviderError("Completion stream error: " + event["error"].dump());
    }
    const auto choices = event.find("choices");
    if (choices == event.end() || !choices->is_array() || choices->empty()) {
        return std::nullopt;
    }
    const auto& choice = choices->front();
    const auto delta = choice.find("delta");
    if (delta == choice.end() || !delta->is_object()) {
        return std::nullopt;
    }
    const auto content = delta->find("content");
    if (content == delta->end() || !content->is_string()) {
        return std::nullopt;
    }
    return content->get<std::string>();
}

std::optional<std::string> parse_ollama_line(const std::string& line, bool& done) {
    const auto trimmed = utils::trim(line);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    const auto event = nlohmann::json::parse(trimmed, nullptr, false);
    if (event.is_discarded()) {
        logging::warn("Ignoring malformed chat line", {kv("payload", trimmed)});
        return std::nullopt;
    }
    if (event.contains("error")) {
        throw ProviderError("Ollama error: " + event["error"].dump());
    }
    if (event.value("done", false)) {
        done = true;
    }
    const auto message = event.find("message");
    if (message == event.end() || !message->is_object()) {
        return std::nullopt;
    }
    return message->value("content", std::string{});
}

OpenAiChatGenerator::OpenAiChatGenerator(std::string base_url,
                                         std::optional<std::string> api_key,
                                         double timeout_sec)
    : client_("openai", std::move(base_url), std::move(api_key),
              RequestOptions::uniform(timeout_sec)) {}

void OpenAiChatGenerator::generate(const std::vector<reply::ChatMessage>& messages,
                                   const reply::GenerationParams& params,
                                   const FragmentHandler& on_fragment) {
    const nlohmann::json body = {
        {"model", params.model},
        {"messages", to_json_messages(messages)},
        {"temperature", params.temperature},
        {"max_tokens", params.max_tokens},
        {"stream", true},
    };
    logging::debug("Requesting chat completion",
                   {kv("model", params.model), kv("messages", messages.size())});
    stream_lines(client_, "/v1/chat/completions", body, parse_openai_event, on_fragment);
}

OllamaChatGenerator::OllamaChatGenerator(std::string base_url, double timeout_sec)
    : client_("ollama", std::move(base_url), std::nullopt, RequestOptions::uniform(timeout_sec)) {}

void OllamaChatGenerator::generate(const std::vector<reply::ChatMessage>& messages,
                                   const reply::GenerationParams& params,
                                   const FragmentHandler& on_fragment) {
    const nlohmann::json body = {
        {"model", params.model},
        {"messages", to_json_messages(messages)},
        {"stream", true},
        {"options", {{"temperature", params.temperature}, {"num_predict", params.max_tokens}}},
    };
    logging::debug("Requesting local chat", {kv("model", params.model),
                                             kv("messages", messages.size())});
    stream_lines(client_, "/api/chat", body, parse_ollama_line, on_fragment);
}

OpenAiEmbedder::OpenAiEmbedder(std::string base_url,
                               std::optional<std::string> api_key,
                               std::string model,
                               double timeout_sec)
    : client_("embeddings", std::move(base_url), std::move(api_key),
              RequestOptions::uniform(timeout_sec)),
      model_(std::move(model)) {}

std::vector<float> OpenAiEmbedder::embed(const std::string& text) {
    const auto started = std::chrono::steady_clock::now();
    const auto response =
        client_.post_json("/v1/embeddings", {{"model", model_}, {"input", text}});
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
    Metrics::instance().observe_provider_call("embeddings", elapsed.count());

    const auto data = response.find("data");
    if (data == response.end() || !data->is_array() || data->empty() ||
        !data->front().contains("embedding")) {
        throw ProviderError("Embedding response has no vector");
    }
    try {
        return data->front()["embedding"].get<std::vector<float>>();
    } catch (const nlohmann::json::exception& ex) {
        throw ProviderError(std::string("Embedding vector is malformed: ") + ex.what());
    }
}

std::unique_ptr<reply::ReplyGenerator> make_reply_generator(const Config& config) {
    if (config.llm_provider == "ollama") {
        return std::make_unique<OllamaChatGenerator>(config.llm_base_url, config.llm_timeout_sec);
    }
    return std::make_unique<OpenAiChatGenerator>(config.llm_base_url, config.llm_api_key,
                                                 config.llm_timeout_sec);
}

}

#include "clinic_voice/reply/history.hpp"

#include <algorithm>

namespace clinic_voice::reply {

GenerationParams GenerationParams::from_config(const Config& config) {
    GenerationParams params;
    params.model = config.llm_model;
    params.temperature = config.llm_temperature;
    params.max_tokens = config.llm_max_tokens;
    return params;
}

ConversationHistory::ConversationHistory(std::string system_prompt, size_t max_messages)
    : max_messages_(std::max<size_t>(max_messages, 3)) {
    messages_.push_back({"system", std::move(system_prompt)});
}

std::vector<ChatMessage> ConversationHistory::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

void ConversationHistory::append_exchange(const std::string& user_text,
                                          const std::string& reply_text) {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back({"user", user_text});
    messages_.push_back({"assistant", reply_text});
    trim_locked();
}

size_t ConversationHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

void ConversationHistory::trim_locked() {
    // Exchanges leave together so the oldest kept message is always a user turn.
    while (messages_.size() > max_messages_ && messages_.size() >= 3) {
        messages_.erase(messages_.begin() + 1, messages_.begin() + 3);
    }
}

}

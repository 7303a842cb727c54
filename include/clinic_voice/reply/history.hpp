#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "clinic_voice/reply/generator.hpp"

namespace clinic_voice {
namespace reply {

// System preamble followed by the most recent turns. Never holds more than
// max_messages entries, preamble included. Whole user/assistant exchanges are
// dropped oldest first, so an even cap leaves one slot unused.
class ConversationHistory {
public:
    ConversationHistory(std::string system_prompt, size_t max_messages);

    std::vector<ChatMessage> snapshot() const;
    void append_exchange(const std::string& user_text, const std::string& reply_text);
    size_t size() const;

private:
    void trim_locked();

    mutable std::mutex mutex_;
    std::vector<ChatMessage> messages_;
    size_t max_messages_;
};

}
}

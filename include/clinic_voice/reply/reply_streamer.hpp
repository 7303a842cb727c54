#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "clinic_voice/reply/generator.hpp"
#include "clinic_voice/reply/history.hpp"
#include "clinic_voice/utils/cancel.hpp"

namespace clinic_voice {
namespace reply {

enum class ReplyStatus { completed, cancelled, failed };

struct ReplyOutcome {
    ReplyStatus status = ReplyStatus::completed;
    std::string reply;
    size_t sentences = 0;
};

struct ReplyRequest {
    std::string user_text;
    // Retrieved passages for grounded replies; absent for open replies.
    std::optional<std::string> context;
};

// Runs one generation and hands each finished sentence to the caller as soon
// as it is complete.
class ReplyStreamer {
public:
    using SentenceHandler = std::function<void(const std::string& sentence)>;

    ReplyStreamer(std::shared_ptr<ReplyGenerator> generator,
                  GenerationParams params,
                  std::string apology_text);

    ReplyOutcome stream(ConversationHistory& history,
                        const ReplyRequest& request,
                        const utils::CancelFlag& cancel,
                        const SentenceHandler& on_sentence) const;

private:
    std::shared_ptr<ReplyGenerator> generator_;
    GenerationParams params_;
    std::string apology_text_;
};

std::string build_grounded_prompt(const std::string& context, const std::string& question);
std::string to_string(ReplyStatus status);

}
}

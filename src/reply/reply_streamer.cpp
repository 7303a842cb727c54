#include "clinic_voice/reply/reply_streamer.hpp"

#include <chrono>
#include <exception>

#include "clinic_voice/errors.hpp"
#include "clinic_voice/logging.hpp"
#include "clinic_voice/metrics.hpp"
#include "clinic_voice/reply/sentence_splitter.hpp"
#include "clinic_voice/utils/text.hpp"

namespace clinic_voice::reply {

std::string build_grounded_prompt(const std::string& context, const std::string& question) {
    return "Context from knowledge base:\n" + context + "\n\nUser question: " + question +
           "\n\nProvide a natural, conversational answer using ONLY the information in the "
           "context above. Keep it brief and suitable for a phone call. If the context does "
           "not answer the question, say you don't have that information and offer to "
           "connect the caller with the office.";
}

std::string to_string(ReplyStatus status) {
    switch (status) {
        case ReplyStatus::completed: return "completed";
        case ReplyStatus::cancelled: return "cancelled";
        case ReplyStatus::failed: return "failed";
    }
    return "failed";
}

ReplyStreamer::ReplyStreamer(std::shared_ptr<ReplyGenerator> generator,
                             GenerationParams params,
                             std::string apology_text)
    : generator_(std::move(generator)),
      params_(std::move(params)),
      apology_text_(std::move(apology_text)) {}

ReplyOutcome ReplyStreamer::stream(ConversationHistory& history,
                                   const ReplyRequest& request,
                                   const utils::CancelFlag& cancel,
                                   const SentenceHandler& on_sentence) const {
    ReplyOutcome outcome;
    auto messages = history.snapshot();
    messages.push_back({"user", request.context
                                    ? build_grounded_prompt(*request.context, request.user_text)
                                    : request.user_text});

    SentenceSplitter splitter;
    auto emit = [&](const std::string& sentence) {
        const auto cleaned = utils::clean_for_speech(sentence);
        if (cleaned.empty() || utils::is_cancelled(cancel)) {
            return;
        }
        on_sentence(cleaned);
        ++outcome.sentences;
    };

    const auto started = std::chrono::steady_clock::now();
    try {
        generator_->generate(messages, params_, [&](const std::string& fragment) {
            if (utils::is_cancelled(cancel)) {
                return false;
            }
            outcome.reply += fragment;
            for (const auto& sentence : splitter.feed(fragment)) {
                emit(sentence);
            }
            return !utils::is_cancelled(cancel);
        });
    } catch (const std::exception& ex) {
        if (utils::is_cancelled(cancel)) {
            outcome.status = ReplyStatus::cancelled;
            return outcome;
        }
        logging::error("Reply generation failed",
                       {kv("error", ex.what()),
                        kv("timeout", dynamic_cast<const ProviderTimeoutError*>(&ex) != nullptr)});
        on_sentence(apology_text_);
        outcome.status = ReplyStatus::failed;
        return outcome;
    }
    Metrics::instance().observe_provider_call(
        "reply_generator",
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());

    if (utils::is_cancelled(cancel)) {
        outcome.status = ReplyStatus::cancelled;
        return outcome;
    }
    if (auto rest = splitter.flush()) {
        emit(*rest);
    }
    if (utils::is_cancelled(cancel)) {
        outcome.status = ReplyStatus::cancelled;
        return outcome;
    }

    outcome.reply = utils::trim(outcome.reply);
    if (outcome.reply.empty() || outcome.sentences == 0) {
        logging::warn("Reply generator returned no text");
        on_sentence(apology_text_);
        outcome.status = ReplyStatus::failed;
        return outcome;
    }
    history.append_exchange(request.user_text, outcome.reply);
    return outcome;
}

}

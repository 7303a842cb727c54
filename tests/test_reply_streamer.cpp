#include <catch2/catch_test_macros.hpp>

#include "clinic_voice/reply/reply_streamer.hpp"

#include "fakes.hpp"

using namespace clinic_voice;
using clinic_voice::testing::FakeGenerator;

namespace {

const std::string kApology = "I'm sorry, I encountered an error processing your request.";

reply::ReplyStreamer make_streamer(std::shared_ptr<FakeGenerator> generator) {
    reply::GenerationParams params;
    params.model = "test-model";
    return reply::ReplyStreamer(std::move(generator), params, kApology);
}

}

TEST_CASE("sentences are handed over as they complete and the exchange is kept") {
    auto generator = std::make_shared<FakeGenerator>(
        std::vector<std::string>{"Hello", "! We are", " open until five. ", "Bye", "."});
    const auto streamer = make_streamer(generator);
    reply::ConversationHistory history("system", 20);
    std::vector<std::string> sentences;

    const auto outcome = streamer.stream(history, {"when do you close", std::nullopt},
                                         utils::make_cancel_flag(),
                                         [&](const std::string& s) { sentences.push_back(s); });

    REQUIRE(outcome.status == reply::ReplyStatus::completed);
    REQUIRE(sentences == std::vector<std::string>{"Hello!", "We are open until five.", "Bye."});
    REQUIRE(outcome.reply == "Hello! We are open until five. Bye.");
    const auto messages = history.snapshot();
    REQUIRE(messages.size() == 3);
    REQUIRE(messages[1].content == "when do you close");
    REQUIRE(messages[2].content == "Hello! We are open until five. Bye.");
}

TEST_CASE("grounded requests wrap the question with the retrieved context") {
    auto generator = std::make_shared<FakeGenerator>(std::vector<std::string>{"Yes we do."});
    const auto streamer = make_streamer(generator);
    reply::ConversationHistory history("system", 20);

    streamer.stream(history, {"do you accept Blue Cross", std::string("[Source 1] ...")},
                    utils::make_cancel_flag(), [](const std::string&) {});

    const auto sent = generator->last_messages();
    REQUIRE(sent.size() == 2);
    REQUIRE(sent.back().role == "user");
    REQUIRE(sent.back().content.find("Context from knowledge base:\n[Source 1] ...") == 0);
    REQUIRE(sent.back().content.find("User question: do you accept Blue Cross") !=
            std::string::npos);
    REQUIRE(history.snapshot()[1].content == "do you accept Blue Cross");
}

TEST_CASE("emoji and markdown are stripped before sentences are spoken") {
    auto generator = std::make_shared<FakeGenerator>(
        std::vector<std::string>{"**Great** \xF0\x9F\x98\x80 news."});
    const auto streamer = make_streamer(generator);
    reply::ConversationHistory history("system", 20);
    std::vector<std::string> sentences;
    streamer.stream(history, {"hi", std::nullopt}, utils::make_cancel_flag(),
                    [&](const std::string& s) { sentences.push_back(s); });
    REQUIRE(sentences == std::vector<std::string>{"Great news."});
}

TEST_CASE("a provider failure speaks the apology and keeps history unchanged") {
    auto generator = std::make_shared<FakeGenerator>();
    generator->set_error("read timeout");
    const auto streamer = make_streamer(generator);
    reply::ConversationHistory history("system", 20);
    std::vector<std::string> sentences;

    const auto outcome = streamer.stream(history, {"hello", std::nullopt},
                                         utils::make_cancel_flag(),
                                         [&](const std::string& s) { sentences.push_back(s); });

    REQUIRE(outcome.status == reply::ReplyStatus::failed);
    REQUIRE(sentences == std::vector<std::string>{kApology});
    REQUIRE(history.size() == 1);
}

TEST_CASE("an empty reply is treated as a failure") {
    auto generator = std::make_shared<FakeGenerator>(std::vector<std::string>{"  "});
    const auto streamer = make_streamer(generator);
    reply::ConversationHistory history("system", 20);
    std::vector<std::string> sentences;
    const auto outcome = streamer.stream(history, {"hello", std::nullopt},
                                         utils::make_cancel_flag(),
                                         [&](const std::string& s) { sentences.push_back(s); });
    REQUIRE(outcome.status == reply::ReplyStatus::failed);
    REQUIRE(sentences == std::vector<std::string>{kApology});
}

TEST_CASE("cancellation stops sentence output and skips history") {
    auto generator = std::make_shared<FakeGenerator>(
        std::vector<std::string>{"First sentence. ", "Second sentence. ", "Third."});
    const auto streamer = make_streamer(generator);
    reply::ConversationHistory history("system", 20);
    auto cancel = utils::make_cancel_flag();
    std::vector<std::string> sentences;

    const auto outcome = streamer.stream(history, {"hello", std::nullopt}, cancel,
                                         [&](const std::string& s) {
                                             sentences.push_back(s);
                                             utils::cancel(cancel);
                                         });

    REQUIRE(outcome.status == reply::ReplyStatus::cancelled);
    REQUIRE(sentences == std::vector<std::string>{"First sentence."});
    REQUIRE(history.size() == 1);
}

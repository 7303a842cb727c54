#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "clinic_voice/audio/codec.hpp"
#include "clinic_voice/errors.hpp"
#include "clinic_voice/playback/scheduler.hpp"
#include "clinic_voice/providers/speech.hpp"
#include "clinic_voice/reply/generator.hpp"
#include "clinic_voice/routing/knowledge_base.hpp"

namespace clinic_voice {
namespace testing {

using SteadyClock = std::chrono::steady_clock;

// Polls until the predicate holds or the timeout expires.
inline bool eventually(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = SteadyClock::now() + timeout;
    while (SteadyClock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

inline routing::Passage make_passage(const std::string& id,
                                     const std::string& text,
                                     double score,
                                     std::optional<std::string> answer = std::nullopt) {
    routing::Passage passage;
    passage.id = id;
    passage.text = text;
    passage.score = score;
    if (answer) {
        passage.kind = routing::PassageKind::curated_qa;
        passage.answer = std::move(answer);
        passage.metadata = {{"type", "qa_pair"}, {"answer", *passage.answer}};
    }
    return passage;
}

// Returns canned results per query; unknown queries return nothing.
class FakeKnowledgeBase : public routing::KnowledgeBase {
public:
    void set_results(const std::string& query, std::vector<routing::Passage> results) {
        std::lock_guard<std::mutex> lock(mutex_);
        results_[query] = std::move(results);
    }

    void fail_with(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = message;
    }

    std::vector<routing::Passage> search(const std::string& query, int k) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        if (!failure_.empty()) {
            throw KnowledgeBaseError(failure_);
        }
        auto it = results_.find(query);
        if (it == results_.end()) {
            return {};
        }
        auto results = it->second;
        if (results.size() > static_cast<size_t>(k)) {
            results.resize(static_cast<size_t>(k));
        }
        return results;
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<routing::Passage>> results_;
    std::string failure_;
    int calls_ = 0;
};

class FakeEmbedder : public routing::Embedder {
public:
    void set(const std::string& text, std::vector<float> vector) {
        vectors_[text] = std::move(vector);
    }

    std::vector<float> embed(const std::string& text) override {
        auto it = vectors_.find(text);
        if (it == vectors_.end()) {
            throw ProviderError("no embedding for " + text);
        }
        return it->second;
    }

private:
    std::map<std::string, std::vector<float>> vectors_;
};

// Streams scripted fragments. Optionally waits for cancellation between
// fragments, or throws instead of answering.
class FakeGenerator : public reply::ReplyGenerator {
public:
    explicit FakeGenerator(std::vector<std::string> fragments = {})
        : fragments_(std::move(fragments)) {}

    void set_fragments(std::vector<std::string> fragments) {
        std::lock_guard<std::mutex> lock(mutex_);
        fragments_ = std::move(fragments);
    }

    void set_error(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = message;
    }

    void set_fragment_delay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delay_ = delay;
    }

    void generate(const std::vector<reply::ChatMessage>& messages,
                  const reply::GenerationParams&,
                  const FragmentHandler& on_fragment) override {
        std::vector<std::string> fragments;
        std::string error;
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++calls_;
            last_messages_ = messages;
            fragments = fragments_;
            error = error_;
            delay = delay_;
        }
        ++active_;
        struct ActiveGuard {
            std::atomic<int>& active;
            ~ActiveGuard() { --active; }
        } guard{active_};
        max_active_ = std::max(max_active_.load(), active_.load());
        if (!error.empty()) {
            throw ProviderTimeoutError(error);
        }
        for (const auto& fragment : fragments) {
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            if (!on_fragment(fragment)) {
                return;
            }
        }
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    int max_active() const {
        return max_active_.load();
    }

    std::vector<reply::ChatMessage> last_messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_messages_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> fragments_;
    std::string error_;
    std::chrono::milliseconds delay_{0};
    int calls_ = 0;
    std::vector<reply::ChatMessage> last_messages_;
    std::atomic<int> active_{0};
    std::atomic<int> max_active_{0};
};

// Produces bytes_per_text bytes of audio per request in fixed-size pieces.
class FakeSynthesizer : public providers::SpeechSynthesizer {
public:
    explicit FakeSynthesizer(size_t bytes_per_text = 800, size_t piece = 160)
        : bytes_per_text_(bytes_per_text), piece_(piece) {}

    void synthesize(const std::string& text,
                    const utils::CancelFlag& cancel,
                    const AudioHandler& on_audio) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            texts_.push_back(text);
        }
        size_t sent = 0;
        while (sent < bytes_per_text_ && !utils::is_cancelled(cancel)) {
            const auto size = std::min(piece_, bytes_per_text_ - sent);
            on_audio(audio::UlawBytes(size, 0x7F));
            sent += size;
        }
    }

    std::vector<std::string> texts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return texts_;
    }

private:
    size_t bytes_per_text_;
    size_t piece_;
    mutable std::mutex mutex_;
    std::vector<std::string> texts_;
};

class FakeRecognitionStream : public providers::RecognitionStream {
public:
    explicit FakeRecognitionStream(std::shared_ptr<std::atomic<int>> closes)
        : closes_(std::move(closes)) {}

    void send_audio(const audio::Pcm16& pcm) override {
        samples_ += pcm.size();
    }

    void close() override {
        ++*closes_;
    }

    size_t samples() const { return samples_; }

private:
    std::shared_ptr<std::atomic<int>> closes_;
    std::atomic<size_t> samples_{0};
};

class FakeRecognizer : public providers::SpeechRecognizer {
public:
    std::unique_ptr<providers::RecognitionStream> open(const std::string& session_id,
                                                       TranscriptHandler on_transcript) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_) {
            throw ProviderTimeoutError("recognizer unreachable");
        }
        handlers_[session_id] = std::move(on_transcript);
        return std::make_unique<FakeRecognitionStream>(closes_);
    }

    void set_failing(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

    bool has_stream(const std::string& session_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.count(session_id) != 0;
    }

    int closes() const { return closes_->load(); }

private:
    mutable std::mutex mutex_;
    std::map<std::string, TranscriptHandler> handlers_;
    std::shared_ptr<std::atomic<int>> closes_ = std::make_shared<std::atomic<int>>(0);
    bool fail_ = false;
};

// Records everything the scheduler sends to the carrier.
class RecordingSink : public playback::AudioSink {
public:
    enum class Kind { audio, clear, mark };

    struct Event {
        Kind kind;
        size_t bytes = 0;
        std::string mark;
        SteadyClock::time_point at;
    };

    void send_audio(const std::vector<uint8_t>& chunk) override {
        record({Kind::audio, chunk.size(), {}, SteadyClock::now()});
    }

    void send_clear() override {
        record({Kind::clear, 0, {}, SteadyClock::now()});
    }

    void send_mark(const std::string& name) override {
        record({Kind::mark, 0, name, SteadyClock::now()});
    }

    std::vector<Event> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t count(Kind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t total = 0;
        for (const auto& event : events_) {
            if (event.kind == kind) {
                ++total;
            }
        }
        return total;
    }

    std::vector<std::string> marks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& event : events_) {
            if (event.kind == Kind::mark) {
                names.push_back(event.mark);
            }
        }
        return names;
    }

private:
    void record(Event event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }

    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

}
}

#include "clinic_voice/reply/sentence_splitter.hpp"

#include <cctype>

#include "clinic_voice/utils/text.hpp"

namespace clinic_voice::reply {

namespace {

bool is_terminator(char ch) {
    return ch == '.' || ch == '!' || ch == '?';
}

}

std::vector<std::string> SentenceSplitter::feed(const std::string& fragment) {
    buffer_ += fragment;
    std::vector<std::string> sentences;
    size_t start = 0;
    for (size_t i = 0; i + 1 < buffer_.size(); ++i) {
        if (!is_terminator(buffer_[i]) ||
            !std::isspace(static_cast<unsigned char>(buffer_[i + 1]))) {
            continue;
        }
        auto sentence = utils::trim(buffer_.substr(start, i + 1 - start));
        if (!sentence.empty()) {
            sentences.push_back(std::move(sentence));
        }
        start = i + 1;
    }
    buffer_.erase(0, start);
    return sentences;
}

std::optional<std::string> SentenceSplitter::flush() {
    auto rest = utils::trim(buffer_);
    buffer_.clear();
    if (rest.empty()) {
        return std::nullopt;
    }
    return rest;
}

}

#include "clinic_voice/utils/text.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>

namespace clinic_voice::utils {

namespace {

// Length of the UTF-8 sequence opened by lead, or 0 when lead cannot open one.
size_t sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

std::optional<uint32_t> decode_at(const std::string& text, size_t index, size_t length) {
    if (length == 0 || index + length > text.size()) {
        return std::nullopt;
    }
    static constexpr unsigned char kLeadMask[] = {0x00, 0x7F, 0x1F, 0x0F, 0x07};
    uint32_t codepoint = static_cast<unsigned char>(text[index]) & kLeadMask[length];
    for (size_t offset = 1; offset < length; ++offset) {
        const auto byte = static_cast<unsigned char>(text[index + offset]);
        if ((byte & 0xC0) != 0x80) {
            return std::nullopt;
        }
        codepoint = (codepoint << 6) | (byte & 0x3F);
    }
    return codepoint;
}

bool is_pictograph(uint32_t codepoint) {
    return (codepoint >= 0x1F000 && codepoint <= 0x1FAFF) ||
           (codepoint >= 0x2600 && codepoint <= 0x27BF) ||
           (codepoint >= 0xFE00 && codepoint <= 0xFE0F) ||
           codepoint == 0x200D;
}

// Markdown emphasis and headings from chat models.
bool is_markup(char ch) {
    return ch == '*' || ch == '`' || ch == '#' || ch == '_';
}

std::string collapse_whitespace(const std::string& text, bool lowercase) {
    std::string result;
    result.reserve(text.size());
    bool pending_space = false;
    for (unsigned char ch : text) {
        if (std::isspace(ch)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(lowercase ? static_cast<char>(std::tolower(ch)) : static_cast<char>(ch));
    }
    return result;
}

}

std::string clean_for_speech(const std::string& text) {
    std::string stripped;
    stripped.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        const auto length = sequence_length(static_cast<unsigned char>(text[i]));
        const auto codepoint = decode_at(text, i, length);
        if (!codepoint) {
            stripped.push_back(text[i]);
            ++i;
            continue;
        }
        if (is_pictograph(*codepoint) || (length == 1 && is_markup(text[i]))) {
            stripped.push_back(' ');
        } else {
            stripped.append(text, i, length);
        }
        i += length;
    }
    return collapse_whitespace(stripped, false);
}

std::string normalize_text(const std::string& text) {
    return collapse_whitespace(text, true);
}

std::string trim(const std::string& text) {
    const auto begin = std::find_if(text.begin(), text.end(),
                                    [](unsigned char ch) { return !std::isspace(ch); });
    const auto end = std::find_if(text.rbegin(), text.rend(),
                                  [](unsigned char ch) { return !std::isspace(ch); }).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

size_t count_words(const std::string& text) {
    size_t words = 0;
    bool in_word = false;
    for (unsigned char ch : text) {
        if (std::isspace(ch)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++words;
        }
    }
    return words;
}

std::string xml_escape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&apos;"; break;
            default: escaped.push_back(ch);
        }
    }
    return escaped;
}

}

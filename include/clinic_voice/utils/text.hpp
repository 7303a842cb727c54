#pragma once

#include <string>

namespace clinic_voice::utils {

// Drops pictographs and markdown markup a voice would read aloud, then
// collapses whitespace.
std::string clean_for_speech(const std::string& text);
// Lowercased, single-spaced form used for keyword matching.
std::string normalize_text(const std::string& text);
std::string trim(const std::string& text);
size_t count_words(const std::string& text);
std::string xml_escape(const std::string& text);

}

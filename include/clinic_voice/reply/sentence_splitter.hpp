#pragma once

#include <optional>
#include <string>
#include <vector>

namespace clinic_voice {
namespace reply {

// Accumulates streamed text and cuts it after '.', '!' or '?' followed by
// whitespace. The terminator stays with its sentence.
class SentenceSplitter {
public:
    std::vector<std::string> feed(const std::string& fragment);
    // Returns the trailing partial sentence, if any, and resets the buffer.
    std::optional<std::string> flush();

private:
    std::string buffer_;
};

}
}

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "clinic_voice/config.hpp"

namespace clinic_voice {
namespace reply {

struct ChatMessage {
    std::string role;
    std::string content;
};

struct GenerationParams {
    std::string model;
    double temperature = 0.7;
    int max_tokens = 150;

    static GenerationParams from_config(const Config& config);
};

// Streams a reply as text fragments. The callback returns false to stop the
// stream early. Provider failures throw ProviderError.
class ReplyGenerator {
public:
    using FragmentHandler = std::function<bool(const std::string& fragment)>;

    virtual ~ReplyGenerator() = default;

    virtual void generate(const std::vector<ChatMessage>& messages,
                          const GenerationParams& params,
                          const FragmentHandler& on_fragment) = 0;
};

}
}

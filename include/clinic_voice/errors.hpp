#pragma once

#include <stdexcept>
#include <string>

namespace clinic_voice {

class ProviderError : public std::runtime_error {
public:
    explicit ProviderError(const std::string& message) : std::runtime_error(message) {}
};

// A bounded wait on a provider expired.
class ProviderTimeoutError : public ProviderError {
public:
    explicit ProviderTimeoutError(const std::string& message) : ProviderError(message) {}
};

class ProviderPermissionError : public ProviderError {
public:
    explicit ProviderPermissionError(const std::string& message) : ProviderError(message) {}
};

class KnowledgeBaseError : public std::runtime_error {
public:
    explicit KnowledgeBaseError(const std::string& message) : std::runtime_error(message) {}
};

}

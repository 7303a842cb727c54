#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "clinic_voice/config.hpp"
#include "spdlog/logger.h"

namespace clinic_voice {
namespace logging {

struct KeyValue {
    std::string key;
    std::string value;
};

template <typename T>
inline KeyValue kv(const std::string& key, const T& value) {
    std::ostringstream oss;
    oss << value;
    return {key, oss.str()};
}

inline KeyValue kv(const std::string& key, bool value) {
    return {key, value ? "true" : "false"};
}

template <typename T>
inline KeyValue kv(const std::string& key, const std::optional<T>& value) {
    if (!value) {
        return {key, "none"};
    }
    return kv(key, *value);
}

// Renders "message [key=value, ...]". Values that would break the layout,
// such as transcripts with spaces or commas, are quoted.
std::string format_kv(std::initializer_list<KeyValue> items);
std::string with_kv(const std::string& message, std::initializer_list<KeyValue> items);
std::string quote_value(const std::string& value);

void init(const Config& config);
// Flushes and releases every sink.
void shutdown();
std::shared_ptr<spdlog::logger> get_logger();

inline void log(spdlog::level::level_enum level,
                const std::string& message,
                std::initializer_list<KeyValue> items = {}) {
    auto logger = get_logger();
    if (logger && logger->should_log(level)) {
        logger->log(level, with_kv(message, items));
    }
}

inline void debug(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::debug, message, items);
}

inline void info(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::info, message, items);
}

inline void warn(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::warn, message, items);
}

inline void error(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::err, message, items);
}

}

using logging::kv;
using logging::debug;
using logging::error;
using logging::info;
using logging::warn;

}

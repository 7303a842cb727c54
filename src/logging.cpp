#include "clinic_voice/logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace clinic_voice::logging {

namespace {

// Worker thread ids tell the per-session scheduler, synthesis and bus threads apart.
constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] [tid %t] %v";
constexpr auto kFlushInterval = std::chrono::seconds(2);

spdlog::level::level_enum level_from_name(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    if (name == "TRACE" || name == "DEBUG") return spdlog::level::debug;
    if (name == "WARN" || name == "WARNING") return spdlog::level::warn;
    if (name == "ERROR") return spdlog::level::err;
    if (name == "CRITICAL") return spdlog::level::critical;
    if (name == "OFF") return spdlog::level::off;
    return spdlog::level::info;
}

bool needs_quotes(const std::string& value) {
    if (value.empty()) {
        return true;
    }
    return std::any_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isspace(ch) || ch == '=' || ch == ',' || ch == '"' || ch == ']';
    });
}

}

std::string quote_value(const std::string& value) {
    if (!needs_quotes(value)) {
        return value;
    }
    std::string quoted = "\"";
    for (char ch : value) {
        if (ch == '"' || ch == '\\') {
            quoted += '\\';
        }
        quoted += ch == '\n' ? ' ' : ch;
    }
    quoted += '"';
    return quoted;
}

std::string format_kv(std::initializer_list<KeyValue> items) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) {
            result += ", ";
        }
        result += item.key + "=" + quote_value(item.value);
    }
    return result;
}

std::string with_kv(const std::string& message, std::initializer_list<KeyValue> items) {
    if (items.size() == 0) {
        return message;
    }
    return message + " [" + format_kv(items) + "]";
}

void init(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (config.log_filename) {
        const std::filesystem::path log_path(*config.log_filename);
        if (!log_path.parent_path().empty()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        // File names carry a start timestamp, so each run appends to its own file.
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(),
                                                                            false));
    }

    auto logger = std::make_shared<spdlog::logger>(config.log_name, sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    spdlog::drop(config.log_name);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    spdlog::set_level(level_from_name(config.log_level));
    spdlog::flush_on(spdlog::level::warn);
    spdlog::flush_every(kFlushInterval);
}

void shutdown() {
    if (auto logger = spdlog::default_logger()) {
        logger->flush();
    }
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> get_logger() {
    return spdlog::default_logger();
}

}

#pragma once

#include <chrono>
#include <functional>
#include <httplib.h>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace clinic_voice {
namespace providers {

struct RequestOptions {
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds read_timeout{30000};
    std::chrono::milliseconds write_timeout{10000};
    // Whole-request budget for streamed responses.
    std::chrono::milliseconds total_timeout{30000};

    static RequestOptions uniform(double seconds);
};

// JSON-over-HTTP client for provider APIs with bearer authorization.
class HttpProviderClient {
public:
    // Receives body bytes as they arrive; return false to stop reading.
    using ChunkHandler = std::function<bool(const char* data, size_t size)>;

    HttpProviderClient(std::string provider,
                       std::string base_url,
                       std::optional<std::string> api_key,
                       RequestOptions options);

    nlohmann::json post_json(const std::string& path, const nlohmann::json& body);

    // Streams the response body. Returns false when the handler stopped the
    // stream. Throws ProviderTimeoutError once the total budget is exceeded.
    bool post_stream(const std::string& path,
                     const nlohmann::json& body,
                     const ChunkHandler& on_chunk);

private:
    httplib::Headers make_headers(const std::string& accept) const;
    template <typename Client>
    void apply_timeouts(Client& client) const;
    template <typename Call>
    auto with_client(Call&& call) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        if (client_https_) {
            return call(*client_https_);
        }
#endif
        return call(*client_http_);
    }

    std::string provider_;
    std::string scheme_;
    std::string host_;
    int port_ = 0;
    std::string base_path_;
    std::optional<std::string> api_key_;
    RequestOptions options_;
    std::unique_ptr<httplib::Client> client_http_;
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    std::unique_ptr<httplib::SSLClient> client_https_;
#endif
};

// Splits a byte stream into lines, carrying partial lines between chunks.
class LineBuffer {
public:
    template <typename Handler>
    bool feed(const char* data, size_t size, Handler&& on_line) {
        buffer_.append(data, size);
        size_t start = 0;
        size_t end = 0;
        while ((end = buffer_.find('\n', start)) != std::string::npos) {
            std::string line = buffer_.substr(start, end - start);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            start = end + 1;
            if (!on_line(line)) {
                buffer_.erase(0, start);
                return false;
            }
        }
        buffer_.erase(0, start);
        return true;
    }

    std::string take_rest() {
        std::string rest;
        rest.swap(buffer_);
        return rest;
    }

private:
    std::string buffer_;
};

}
}

#include "clinic_voice/providers/http_client.hpp"

#include <httplib.h>
#include <utility>

#include "clinic_voice/errors.hpp"
#include "clinic_voice/logging.hpp"
#include "clinic_voice/utils/http.hpp"

namespace clinic_voice::providers {

namespace {

std::string snippet(const std::string& body) {
    constexpr size_t kLimit = 256;
    return body.size() > kLimit ? body.substr(0, kLimit) : body;
}

void check_status(const std::string& provider, int status, const std::string& body) {
    if (status == 401 || status == 403) {
        throw ProviderPermissionError(provider + " rejected credentials (" +
                                      std::to_string(status) + "): " + snippet(body));
    }
    if (status == 408 || status == 504) {
        throw ProviderTimeoutError(provider + " timed out (" + std::to_string(status) + ")");
    }
    if (status < 200 || status >= 300) {
        throw ProviderError(provider + " returned " + std::to_string(status) + ": " +
                            snippet(body));
    }
}

[[noreturn]] void throw_transport_error(const std::string& provider, httplib::Error error) {
    const auto description = httplib::to_string(error);
    if (error == httplib::Error::Read || error == httplib::Error::Write ||
        error == httplib::Error::ConnectionTimeout) {
        throw ProviderTimeoutError(provider + " request timed out: " + description);
    }
    throw ProviderError(provider + " request failed: " + description);
}

}

RequestOptions RequestOptions::uniform(double seconds) {
    const auto budget = std::chrono::milliseconds(static_cast<long>(seconds * 1000.0));
    RequestOptions options;
    options.connect_timeout = budget;
    options.read_timeout = budget;
    options.write_timeout = budget;
    options.total_timeout = budget;
    return options;
}

HttpProviderClient::HttpProviderClient(std::string provider,
                                       std::string base_url,
                                       std::optional<std::string> api_key,
                                       RequestOptions options)
    : provider_(std::move(provider)),
      api_key_(std::move(api_key)),
      options_(options) {
    utils::parse_url(base_url, scheme_, host_, port_, base_path_);
    if (base_path_ == "/") {
        base_path_.clear();
    }

    if (scheme_ == "https") {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        client_https_ = std::make_unique<httplib::SSLClient>(host_, port_);
        client_https_->enable_server_certificate_verification(false);
        apply_timeouts(*client_https_);
#else
        throw ProviderError("HTTPS provider requires CPPHTTPLIB_OPENSSL_SUPPORT");
#endif
    } else {
        client_http_ = std::make_unique<httplib::Client>(host_, port_);
        apply_timeouts(*client_http_);
    }
}

template <typename Client>
void HttpProviderClient::apply_timeouts(Client& client) const {
    const auto seconds = [](std::chrono::milliseconds value) {
        return static_cast<time_t>(value.count() / 1000);
    };
    const auto micros = [](std::chrono::milliseconds value) {
        return static_cast<time_t>((value.count() % 1000) * 1000);
    };
    client.set_connection_timeout(seconds(options_.connect_timeout),
                                  micros(options_.connect_timeout));
    client.set_read_timeout(seconds(options_.read_timeout), micros(options_.read_timeout));
    client.set_write_timeout(seconds(options_.write_timeout), micros(options_.write_timeout));
}

httplib::Headers HttpProviderClient::make_headers(const std::string& accept) const {
    auto headers = httplib::Headers{{"Accept", accept}};
    if (api_key_) {
        headers.emplace("Authorization", "Bearer " + *api_key_);
    }
    return headers;
}

nlohmann::json HttpProviderClient::post_json(const std::string& path,
                                             const nlohmann::json& body) {
    const auto headers = make_headers("application/json");
    const auto full_path = utils::join_path(base_path_, path);
    auto response = with_client([&](auto& client) {
        return client.Post(full_path, headers, body.dump(), "application/json");
    });
    if (!response) {
        throw_transport_error(provider_, response.error());
    }
    check_status(provider_, response->status, response->body);
    try {
        return nlohmann::json::parse(response->body);
    } catch (const nlohmann::json::exception& ex) {
        throw ProviderError(provider_ + " returned invalid JSON: " + ex.what());
    }
}

bool HttpProviderClient::post_stream(const std::string& path,
                                     const nlohmann::json& body,
                                     const ChunkHandler& on_chunk) {
    httplib::Request request;
    request.method = "POST";
    request.path = utils::join_path(base_path_, path);
    request.headers = make_headers("text/event-stream, application/x-ndjson, application/json");
    request.headers.emplace("Content-Type", "application/json");
    request.body = body.dump();

    const auto deadline = std::chrono::steady_clock::now() + options_.total_timeout;
    httplib::Response response;
    bool stopped = false;
    bool expired = false;
    std::string error_body;
    request.content_receiver = [&](const char* data, size_t size, uint64_t, uint64_t) {
        if (response.status < 200 || response.status >= 300) {
            error_body.append(data, size);
            return true;
        }
        if (std::chrono::steady_clock::now() > deadline) {
            expired = true;
            return false;
        }
        if (!on_chunk(data, size)) {
            stopped = true;
            return false;
        }
        return true;
    };

    httplib::Error error = httplib::Error::Success;
    const bool ok = with_client([&](auto& client) {
        return client.send(request, response, error);
    });
    if (expired) {
        throw ProviderTimeoutError(provider_ + " stream exceeded " +
                                   std::to_string(options_.total_timeout.count()) + " ms");
    }
    if (stopped) {
        return false;
    }
    if (!ok) {
        throw_transport_error(provider_, error);
    }
    check_status(provider_, response.status, error_body);
    return true;
}

}

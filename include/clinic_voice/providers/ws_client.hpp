#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace clinic_voice {
namespace providers {

// Client websocket for streaming providers. Handles ws:// and wss:// URLs and
// runs its io loop on a private thread.
class WsConnection {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;
    using MessageHandler = std::function<void(const std::string& payload, bool binary)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    explicit WsConnection(std::string name);
    ~WsConnection();

    WsConnection(const WsConnection&) = delete;
    WsConnection& operator=(const WsConnection&) = delete;

    // Blocks until the handshake completes. Throws ProviderError on failure and
    // ProviderTimeoutError when the timeout expires first.
    void connect(const std::string& url,
                 const Headers& headers,
                 std::chrono::milliseconds timeout,
                 MessageHandler on_message,
                 CloseHandler on_close);

    bool send_text(const std::string& payload);
    bool send_binary(const void* data, size_t size);

    // Graceful close; must not be called from a message or close handler.
    void close();
    bool is_open() const;

private:
    struct Impl;
    std::string name_;
    std::unique_ptr<Impl> impl_;
};

}
}

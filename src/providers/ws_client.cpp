#include "clinic_voice/providers/ws_client.hpp"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "clinic_voice/errors.hpp"
#include "clinic_voice/logging.hpp"

namespace clinic_voice::providers {

namespace {

using PlainClient = websocketpp::client<websocketpp::config::asio_client>;
using TlsClient = websocketpp::client<websocketpp::config::asio_tls_client>;
using SslContext = websocketpp::lib::asio::ssl::context;

constexpr auto kCloseWait = std::chrono::seconds(2);

struct ConnectionState {
    std::mutex mutex;
    std::condition_variable cv;
    bool opened = false;
    bool finished = false;
    std::string reason;
    WsConnection::MessageHandler on_message;
    WsConnection::CloseHandler on_close;

    void mark_open() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            opened = true;
        }
        cv.notify_all();
    }

    void mark_finished(const std::string& why) {
        WsConnection::CloseHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (finished) {
                return;
            }
            finished = true;
            reason = why;
            handler = on_close;
        }
        cv.notify_all();
        if (handler) {
            handler(why);
        }
    }
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual void start(const std::string& url, const WsConnection::Headers& headers) = 0;
    virtual bool send(const std::string& payload, websocketpp::frame::opcode::value opcode) = 0;
    virtual void close() = 0;
    virtual void stop() = 0;
    virtual void join() = 0;
};

void configure_tls(PlainClient&) {}

void configure_tls(TlsClient& client) {
    client.set_tls_init_handler([](websocketpp::connection_hdl) {
        auto context = websocketpp::lib::make_shared<SslContext>(SslContext::tlsv12_client);
        context->set_options(SslContext::default_workarounds | SslContext::no_sslv2 |
                             SslContext::no_sslv3);
        context->set_verify_mode(websocketpp::lib::asio::ssl::verify_none);
        return context;
    });
}

template <typename Client>
class BasicTransport : public Transport,
                       public std::enable_shared_from_this<BasicTransport<Client>> {
public:
    BasicTransport(std::string name, std::shared_ptr<ConnectionState> state)
        : name_(std::move(name)), state_(std::move(state)) {
        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.clear_error_channels(websocketpp::log::elevel::all);
        client_.init_asio();
        configure_tls(client_);

        client_.set_open_handler([this](websocketpp::connection_hdl) { state_->mark_open(); });
        client_.set_fail_handler([this](websocketpp::connection_hdl hdl) {
            websocketpp::lib::error_code ec;
            auto connection = client_.get_con_from_hdl(hdl, ec);
            state_->mark_finished(connection ? connection->get_ec().message()
                                             : std::string("connection failed"));
        });
        client_.set_close_handler([this](websocketpp::connection_hdl hdl) {
            websocketpp::lib::error_code ec;
            auto connection = client_.get_con_from_hdl(hdl, ec);
            std::string reason = "closed";
            if (connection) {
                reason = "closed (" + std::to_string(connection->get_remote_close_code()) + ")";
                if (!connection->get_remote_close_reason().empty()) {
                    reason += " " + connection->get_remote_close_reason();
                }
            }
            state_->mark_finished(reason);
        });
        client_.set_message_handler(
            [this](websocketpp::connection_hdl, typename Client::message_ptr message) {
                if (!state_->on_message) {
                    return;
                }
                const bool binary = message->get_opcode() == websocketpp::frame::opcode::binary;
                try {
                    state_->on_message(message->get_payload(), binary);
                } catch (const std::exception& ex) {
                    logging::error("Websocket message handler failed",
                                   {kv("connection", name_), kv("error", ex.what())});
                }
            });
    }

    void start(const std::string& url, const WsConnection::Headers& headers) override {
        websocketpp::lib::error_code ec;
        auto connection = client_.get_connection(url, ec);
        if (ec) {
            throw ProviderError(name_ + " websocket setup failed: " + ec.message());
        }
        for (const auto& header : headers) {
            connection->append_header(header.first, header.second);
        }
        handle_ = connection->get_handle();
        client_.connect(connection);
        auto self = this->shared_from_this();
        worker_ = std::thread([self]() {
            try {
                self->client_.run();
            } catch (const std::exception& ex) {
                logging::error("Websocket loop failed",
                               {kv("connection", self->name_), kv("error", ex.what())});
            }
            self->state_->mark_finished("io loop stopped");
        });
    }

    bool send(const std::string& payload, websocketpp::frame::opcode::value opcode) override {
        websocketpp::lib::error_code ec;
        client_.send(handle_, payload, opcode, ec);
        if (ec) {
            logging::debug("Websocket send failed",
                           {kv("connection", name_), kv("error", ec.message())});
            return false;
        }
        return true;
    }

    void close() override {
        websocketpp::lib::error_code ec;
        client_.close(handle_, websocketpp::close::status::normal, "done", ec);
    }

    void stop() override {
        client_.stop();
    }

    void join() override {
        if (!worker_.joinable()) {
            return;
        }
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
            return;
        }
        worker_.join();
    }

private:
    std::string name_;
    std::shared_ptr<ConnectionState> state_;
    Client client_;
    websocketpp::connection_hdl handle_;
    std::thread worker_;
};

bool is_secure(const std::string& url) {
    return url.rfind("wss://", 0) == 0;
}

}

struct WsConnection::Impl {
    std::shared_ptr<ConnectionState> state = std::make_shared<ConnectionState>();
    std::shared_ptr<Transport> transport;
    std::atomic<bool> closed{false};
};

WsConnection::WsConnection(std::string name)
    : name_(std::move(name)), impl_(std::make_unique<Impl>()) {}

WsConnection::~WsConnection() {
    close();
}

void WsConnection::connect(const std::string& url,
                           const Headers& headers,
                           std::chrono::milliseconds timeout,
                           MessageHandler on_message,
                           CloseHandler on_close) {
    if (impl_->transport) {
        throw ProviderError(name_ + " websocket already connected");
    }
    auto state = impl_->state;
    state->on_message = std::move(on_message);
    state->on_close = std::move(on_close);

    if (is_secure(url)) {
        impl_->transport = std::make_shared<BasicTransport<TlsClient>>(name_, state);
    } else {
        impl_->transport = std::make_shared<BasicTransport<PlainClient>>(name_, state);
    }
    impl_->transport->start(url, headers);

    std::unique_lock<std::mutex> lock(state->mutex);
    const bool settled = state->cv.wait_for(
        lock, timeout, [&state]() { return state->opened || state->finished; });
    if (!settled) {
        lock.unlock();
        impl_->transport->stop();
        impl_->transport->join();
        impl_->closed = true;
        throw ProviderTimeoutError(name_ + " websocket connect timed out");
    }
    if (!state->opened) {
        const auto reason = state->reason;
        lock.unlock();
        impl_->transport->join();
        impl_->closed = true;
        throw ProviderError(name_ + " websocket connect failed: " + reason);
    }
    logging::info("Websocket connected", {kv("connection", name_)});
}

bool WsConnection::send_text(const std::string& payload) {
    if (!is_open()) {
        return false;
    }
    return impl_->transport->send(payload, websocketpp::frame::opcode::text);
}

bool WsConnection::send_binary(const void* data, size_t size) {
    if (!is_open()) {
        return false;
    }
    return impl_->transport->send(std::string(static_cast<const char*>(data), size),
                                  websocketpp::frame::opcode::binary);
}

void WsConnection::close() {
    if (!impl_ || !impl_->transport || impl_->closed.exchange(true)) {
        return;
    }
    auto state = impl_->state;
    bool finished = false;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        finished = state->finished;
    }
    if (!finished) {
        impl_->transport->close();
        std::unique_lock<std::mutex> lock(state->mutex);
        finished = state->cv.wait_for(lock, kCloseWait, [&state]() { return state->finished; });
    }
    if (!finished) {
        logging::warn("Websocket close timed out, stopping", {kv("connection", name_)});
        impl_->transport->stop();
    }
    impl_->transport->join();
}

bool WsConnection::is_open() const {
    if (!impl_->transport || impl_->closed) {
        return false;
    }
    std::lock_guard<std::mutex> lock(impl_->state->mutex);
    return impl_->state->opened && !impl_->state->finished;
}

}

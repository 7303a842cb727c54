#include "clinic_voice/bus/message_bus.hpp"

#include <exception>
#include <stdexcept>

#include "clinic_voice/logging.hpp"
#include "clinic_voice/metrics.hpp"

namespace clinic_voice::bus {

LocalBus::~LocalBus() {
    close();
}

void LocalBus::publish(const std::string& queue, const nlohmann::json& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            logging::debug("Bus closed, message discarded", {kv("queue", queue)});
            return;
        }
        auto& entry = queues_[queue];
        if (!entry) {
            entry = std::make_unique<Queue>();
        }
        entry->messages.push_back(message);
    }
    cv_.notify_all();
}

void LocalBus::consume(const std::string& queue, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw std::runtime_error("message bus is closed");
    }
    auto& entry = queues_[queue];
    if (!entry) {
        entry = std::make_unique<Queue>();
    }
    if (entry->handler) {
        throw std::runtime_error("queue already has a consumer: " + queue);
    }
    entry->handler = std::move(handler);
    Queue* raw = entry.get();
    entry->worker = std::thread([this, queue, raw]() { worker_loop(queue, *raw); });
    logging::debug("Bus consumer registered", {kv("queue", queue)});
}

void LocalBus::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }
    cv_.notify_all();
    idle_cv_.notify_all();
    for (auto& item : queues_) {
        if (item.second->worker.joinable()) {
            item.second->worker.join();
        }
    }
}

bool LocalBus::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return closed_ || idle_locked(); });
}

size_t LocalBus::pending(const std::string& queue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(queue);
    return it == queues_.end() ? 0 : it->second->messages.size();
}

bool LocalBus::idle_locked() const {
    for (const auto& item : queues_) {
        const auto& queue = *item.second;
        if (queue.busy || (queue.handler && !queue.messages.empty())) {
            return false;
        }
    }
    return true;
}

void LocalBus::worker_loop(const std::string& name, Queue& queue) {
    while (true) {
        nlohmann::json message;
        Handler handler;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&]() { return closed_ || !queue.messages.empty(); });
            if (closed_) {
                break;
            }
            message = std::move(queue.messages.front());
            queue.messages.pop_front();
            queue.busy = true;
            handler = queue.handler;
        }
        try {
            handler(message);
        } catch (const std::exception& ex) {
            logging::error("Bus handler failed, message dropped",
                           {kv("queue", name),
                            kv("session_id", message.is_object()
                                                 ? message.value("session_id", "")
                                                 : std::string()),
                            kv("error", ex.what())});
            Metrics::instance().increment_dropped_message(name);
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue.busy = false;
        }
        idle_cv_.notify_all();
    }
}

}

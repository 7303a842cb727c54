#include "clinic_voice/session/registry.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

#include "clinic_voice/logging.hpp"
#include "clinic_voice/metrics.hpp"

namespace clinic_voice::session {

void SessionRegistry::add(std::shared_ptr<Session> session) {
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.count(session->id()) != 0) {
            throw std::runtime_error("session already registered: " + session->id());
        }
        if (!session->call_sid().empty()) {
            call_index_[session->call_sid()] = session->id();
        }
        sessions_.emplace(session->id(), std::move(session));
        count = sessions_.size();
    }
    Metrics::instance().set_active_sessions(count);
}

std::shared_ptr<Session> SessionRegistry::get(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<Session> SessionRegistry::find_by_call(const std::string& call_sid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index = call_index_.find(call_sid);
    if (index == call_index_.end()) {
        return nullptr;
    }
    auto it = sessions_.find(index->second);
    return it == sessions_.end() ? nullptr : it->second;
}

bool SessionRegistry::destroy(const std::string& session_id) {
    std::shared_ptr<Session> session;
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = std::move(it->second);
        sessions_.erase(it);
        auto index = call_index_.find(session->call_sid());
        if (index != call_index_.end() && index->second == session_id) {
            call_index_.erase(index);
        }
        count = sessions_.size();
    }
    Metrics::instance().set_active_sessions(count);
    session->close();
    return true;
}

void SessionRegistry::close_all() {
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
        call_index_.clear();
    }
    Metrics::instance().set_active_sessions(0);
    for (auto& item : sessions) {
        item.second->close();
    }
    if (!sessions.empty()) {
        logging::info("Closed all sessions", {kv("count", sessions.size())});
    }
}

std::vector<std::shared_ptr<Session>> SessionRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Session>> result;
    result.reserve(sessions_.size());
    for (const auto& item : sessions_) {
        result.push_back(item.second);
    }
    return result;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::string generate_session_id() {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> distribution;
    const auto high = distribution(generator);
    const auto low = distribution(generator);
    std::ostringstream out;
    out << std::hex << std::setfill('0') << std::setw(16) << high << std::setw(16) << low;
    auto id = out.str();
    id.insert(20, "-");
    id.insert(16, "-");
    id.insert(12, "-");
    id.insert(8, "-");
    return id;
}

}

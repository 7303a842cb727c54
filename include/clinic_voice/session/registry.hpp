#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "clinic_voice/session/session.hpp"

namespace clinic_voice {
namespace session {

// Owns live sessions, indexed by session id and by carrier call id.
class SessionRegistry {
public:
    void add(std::shared_ptr<Session> session);
    std::shared_ptr<Session> get(const std::string& session_id) const;
    std::shared_ptr<Session> find_by_call(const std::string& call_sid) const;

    // Closes and forgets the session. Returns false when it was already gone.
    bool destroy(const std::string& session_id);
    void close_all();

    std::vector<std::shared_ptr<Session>> list() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    std::unordered_map<std::string, std::string> call_index_;
};

std::string generate_session_id();

}
}

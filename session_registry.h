#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "session_info.h"

// A peer picked for delivery, copied out so sends happen without the registry lock
struct PeerTarget {
    std::string                     connection_id;
    std::shared_ptr<PeerConnection> peer;
};

// Thread-safe registry of connected browser sessions, keyed by connection id.
// The lock is never held across network I/O.
class SessionRegistry {
public:
    void add(const std::string& connection_id, std::shared_ptr<PeerConnection> peer) {
        std::lock_guard<std::mutex> lock(mutex_);
        Session                     session;
        session.connection_id = connection_id;
        session.peer          = std::move(peer);

        sessions_[connection_id] = std::move(session);
    }

    std::optional<Session> remove(const std::string& connection_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = sessions_.find(connection_id);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        Session session = std::move(it->second);
        sessions_.erase(it);
        return session;
    }

    bool exists(const std::string& connection_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.contains(connection_id);
    }

    // Binds a client id to the session; returns the id it replaces, if any
    std::optional<std::string> identify(const std::string& connection_id,
                                        const std::string& client_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = sessions_.find(connection_id);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        std::optional<std::string> previous = it->second.client_id;
        it->second.client_id                = client_id;
        return previous;
    }

    std::optional<std::string> client_id(const std::string& connection_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = sessions_.find(connection_id);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        return it->second.client_id;
    }

    // Access session with lambda (thread-safe). func must not do network I/O.
    template <typename Func>
    bool with_session(const std::string& connection_id, Func&& func) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = sessions_.find(connection_id);
        if (it != sessions_.end()) {
            func(it->second);
            return true;
        }
        return false;
    }

    std::shared_ptr<PeerConnection> peer(const std::string& connection_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = sessions_.find(connection_id);
        if (it == sessions_.end()) {
            return nullptr;
        }
        return it->second.peer;
    }

    // Peers whose session satisfies pred
    std::vector<PeerTarget> select(const std::function<bool(const Session&)>& pred) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<PeerTarget>     result;
        result.reserve(sessions_.size());
        for (const auto& [id, session]: sessions_) {
            if (pred(session)) {
                result.push_back(PeerTarget{id, session.peer});
            }
        }
        return result;
    }

    std::vector<PeerTarget> all() const {
        return select([](const Session&) { return true; });
    }

    std::vector<PeerTarget> all_except(const std::string& connection_id) const {
        return select([&](const Session& s) { return s.connection_id != connection_id; });
    }

    std::vector<PeerTarget> with_client_id(const std::string& client_id) const {
        return select([&](const Session& s) { return s.client_id == client_id; });
    }

    std::vector<SessionInfo> get_all_info() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<SessionInfo>    result;
        result.reserve(sessions_.size());
        for (const auto& [id, session]: sessions_) {
            SessionInfo info;
            info.connection_id  = id;
            info.client_id      = session.client_id;
            info.remote_address = session.peer ? session.peer->remote_address() : std::string{};
            info.transmitting   = session.transmitting;
            result.push_back(std::move(info));
        }
        return result;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

    bool empty() const {
        return count() == 0;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.clear();
    }

private:
    mutable std::mutex                       mutex_;
    std::unordered_map<std::string, Session> sessions_;
};


#include "session_table.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

SessionTable::SessionTable(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("Session table capacity must be positive");
    }
}

void SessionTable::touch(const std::string& session_id, const std::string& user_id, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(session_id);
    if (it != index_.end()) {
        it->second->user_id = user_id;
        it->second->last_activity = now;
        sessions_.splice(sessions_.begin(), sessions_, it->second);
        return;
    }

    if (sessions_.size() >= capacity_) {
        const WebSession& oldest = sessions_.back();
        spdlog::debug("Session table full, evicting session {}", oldest.session_id);
        index_.erase(oldest.session_id);
        sessions_.pop_back();
    }

    sessions_.push_front(WebSession{session_id, user_id, now});
    index_[session_id] = sessions_.begin();
}

std::optional<WebSession> SessionTable::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(session_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return *it->second;
}

std::vector<WebSession> SessionTable::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<WebSession>(sessions_.begin(), sessions_.end());
}

size_t SessionTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SessionTable::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.clear();
    index_.clear();
}

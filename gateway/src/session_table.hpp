
#pragma once
#include "models.hpp"
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct WebSession {
    std::string session_id;
    std::string user_id;
    TimePoint last_activity;
};

// Web sessions keyed by client-supplied id. Capacity-bounded: inserting into
// a full table evicts the least recently active session.
class SessionTable {
public:
    explicit SessionTable(size_t capacity);

    // Creates the session or updates it in place (last write wins).
    void touch(const std::string& session_id, const std::string& user_id, TimePoint now);

    std::optional<WebSession> find(const std::string& session_id) const;
    std::vector<WebSession> snapshot() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
    void clear();

private:
    const size_t capacity_;
    // Most recently active at the front
    std::list<WebSession> sessions_;
    std::unordered_map<std::string, std::list<WebSession>::iterator> index_;
    mutable std::mutex mutex_;
};


#pragma once
#include "models.hpp"
#include <mutex>
#include <string>
#include <vector>

struct CommandHistoryEntry {
    std::string command;
    std::vector<std::string> args;
    TimePoint timestamp;
    std::string user_id;
};

// Fixed-capacity ring buffer of CLI commands; the oldest entry is
// overwritten once the buffer is full.
class CommandHistory {
public:
    explicit CommandHistory(size_t capacity);

    void append(CommandHistoryEntry entry);

    // Up to `count` most recent entries, oldest first.
    std::vector<CommandHistoryEntry> recent(size_t count) const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    void clear();

private:
    const size_t capacity_;
    std::vector<CommandHistoryEntry> buffer_;
    size_t head_ = 0;  // next slot to write once the buffer is full
    mutable std::mutex mutex_;
};


#include "command_history.hpp"
#include <algorithm>
#include <stdexcept>

CommandHistory::CommandHistory(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("Command history capacity must be positive");
    }
    buffer_.reserve(capacity_);
}

void CommandHistory::append(CommandHistoryEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (buffer_.size() < capacity_) {
        buffer_.push_back(std::move(entry));
        return;
    }
    buffer_[head_] = std::move(entry);
    head_ = (head_ + 1) % capacity_;
}

std::vector<CommandHistoryEntry> CommandHistory::recent(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = std::min(count, buffer_.size());
    std::vector<CommandHistoryEntry> out;
    out.reserve(n);

    // Oldest entry sits at head_ when full, at 0 otherwise
    size_t oldest = buffer_.size() < capacity_ ? 0 : head_;
    size_t skip = buffer_.size() - n;
    for (size_t i = 0; i < n; ++i) {
        out.push_back(buffer_[(oldest + skip + i) % buffer_.size()]);
    }
    return out;
}

size_t CommandHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

void CommandHistory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.clear();
    head_ = 0;
}

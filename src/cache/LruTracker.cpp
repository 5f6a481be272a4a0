#include "LruTracker.hpp"

void LruTracker::touch(const std::string& key) {
    auto it = positions_.find(key);
    if (it != positions_.end()) {
        // Already tracked, move its node to the front without reallocating
        order_.splice(order_.begin(), order_, it->second);
        return;
    }
    order_.push_front(key);
    positions_.emplace(key, order_.begin());
}

bool LruTracker::remove(const std::string& key) {
    auto it = positions_.find(key);
    if (it == positions_.end()) {
        return false;
    }
    order_.erase(it->second);
    positions_.erase(it);
    return true;
}

std::optional<std::string> LruTracker::leastRecent() const {
    if (order_.empty()) {
        return std::nullopt;
    }
    return order_.back();
}

void LruTracker::clear() {
    order_.clear();
    positions_.clear();
}

#ifndef LRUTRACKER_HPP
#define LRUTRACKER_HPP

#include <cstddef>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>

// Recency order of keys. front = most recently used, back = least recently used.
// Not synchronized: the owner mutates it inside the same critical section as the
// entry map so the two can never disagree.
class LruTracker {
public:
    // Marks key as most recently used, inserting it if unknown.
    void touch(const std::string& key);

    // Forgets key. Returns false if it was not tracked.
    bool remove(const std::string& key);

    // Least recently used key, if any. Does not remove it.
    std::optional<std::string> leastRecent() const;

    bool contains(const std::string& key) const { return positions_.count(key) > 0; }
    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }
    void clear();

private:
    std::list<std::string> order_;
    std::unordered_map<std::string, std::list<std::string>::iterator> positions_;
};

#endif // LRUTRACKER_HPP

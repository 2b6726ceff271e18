#include "EvictionStore.hpp"
#include "Logger.hpp"

#include <unordered_set>


// Desc: look up an entry and mark it most recently used
// In: const std::string& key
// Out: std::optional<HttpResponse> (copy of the payload, empty on miss)
std::optional<HttpResponse> EvictionStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;

    lru_.splice(lru_.end(), lru_, it->second);
    it->second->access_count++;
    return it->second->payload;
}


// Desc: insert or replace an entry, evicting from the LRU end to make room
// In: const std::string& key, const HttpResponse& payload, uint64_t size_bytes
// Out: bool (false if the payload alone exceeds the budget)
bool EvictionStore::set(const std::string& key, const HttpResponse& payload, std::uint64_t size_bytes) {
    if (size_bytes > max_bytes_) {
        #ifdef DEBUG
        Logger::info("EvictionStore", "oversized, not cached: " + key);
        #endif
        return false;
    }

    std::lock_guard<std::mutex> lk(mu_);

    auto it = index_.find(key);
    if (it != index_.end()) {
        Entry& e = *it->second;
        current_bytes_ -= e.size_bytes;
        // Drop the old size before making room so an update never evicts itself.
        lru_.splice(lru_.end(), lru_, it->second);
        while (current_bytes_ + size_bytes > max_bytes_ && lru_.size() > 1) {
            (void)evict_one_locked();
        }
        e.payload = payload;
        e.size_bytes = size_bytes;
        e.access_count = 1;
        current_bytes_ += size_bytes;
        return true;
    }

    while (current_bytes_ + size_bytes > max_bytes_ && !lru_.empty()) {
        (void)evict_one_locked();
    }

    lru_.push_back(Entry{key, payload, size_bytes, 1});
    index_.emplace(key, std::prev(lru_.end()));
    current_bytes_ += size_bytes;
    return true;
}


std::optional<std::string> EvictionStore::evict_one() {
    std::lock_guard<std::mutex> lk(mu_);
    return evict_one_locked();
}


// Desc: remove the least recently used entry (caller holds mu_)
// In: (none)
// Out: std::optional<std::string> (evicted key)
std::optional<std::string> EvictionStore::evict_one_locked() {
    if (lru_.empty()) return std::nullopt;

    Entry& victim = lru_.front();
    std::string key = std::move(victim.key);
    current_bytes_ -= victim.size_bytes;
    index_.erase(key);
    lru_.pop_front();
    ++evictions_;

    #ifdef DEBUG
    Logger::info("EvictionStore", "evicted " + key);
    #endif
    return key;
}


void EvictionStore::clear() {
    std::lock_guard<std::mutex> lk(mu_);
    index_.clear();
    lru_.clear();
    current_bytes_ = 0;
}


bool EvictionStore::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mu_);
    return index_.count(key) != 0;
}


std::optional<HttpResponse> EvictionStore::peek(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return it->second->payload;
}


std::optional<std::uint64_t> EvictionStore::access_count(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return it->second->access_count;
}


// Desc: snapshot of keys in recency order
// In: (none)
// Out: std::vector<std::string> (least recently used first)
std::vector<std::string> EvictionStore::keys() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(lru_.size());
    for (const auto& e : lru_) out.push_back(e.key);
    return out;
}


std::size_t EvictionStore::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return index_.size();
}

std::uint64_t EvictionStore::current_bytes() const {
    std::lock_guard<std::mutex> lk(mu_);
    return current_bytes_;
}

std::uint64_t EvictionStore::eviction_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return evictions_;
}


// Desc: check map/list agreement, size accounting and budget
// In: (none)
// Out: bool
bool EvictionStore::verify_integrity() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (lru_.size() != index_.size()) return false;

    std::unordered_set<std::string> seen;
    std::uint64_t sum = 0;
    for (auto it = lru_.begin(); it != lru_.end(); ++it) {
        if (!seen.insert(it->key).second) return false;
        auto found = index_.find(it->key);
        if (found == index_.end() || found->second != it) return false;
        sum += it->size_bytes;
    }
    return sum == current_bytes_ && current_bytes_ <= max_bytes_;
}

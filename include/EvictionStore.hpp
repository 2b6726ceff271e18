// include/EvictionStore.hpp
#pragma once
#include "HttpTypes.hpp"

#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Byte-budgeted LRU store. The list runs from least recently used (front)
// to most recently used (back); the map holds each key's list position so
// every operation is a constant-time splice.
class EvictionStore {
public:
    struct Entry {
        std::string key;
        HttpResponse payload;
        std::uint64_t size_bytes{0};
        std::uint64_t access_count{0};
    };

public:
    explicit EvictionStore(std::uint64_t max_bytes) : max_bytes_(max_bytes) {}

    std::optional<HttpResponse> get(const std::string& key);
    bool set(const std::string& key, const HttpResponse& payload, std::uint64_t size_bytes);
    std::optional<std::string> evict_one();
    void clear();

    // No recency change.
    bool contains(const std::string& key) const;
    std::optional<HttpResponse> peek(const std::string& key) const;
    std::optional<std::uint64_t> access_count(const std::string& key) const;
    std::vector<std::string> keys() const;

    std::size_t size() const;
    std::uint64_t current_bytes() const;
    std::uint64_t max_bytes() const { return max_bytes_; }
    std::uint64_t eviction_count() const;

    // Walks list and map; true when every structural invariant holds.
    bool verify_integrity() const;

private:
    using List = std::list<Entry>;

    std::optional<std::string> evict_one_locked();

private:
    mutable std::mutex mu_;
    List lru_;
    std::unordered_map<std::string, List::iterator> index_;
    const std::uint64_t max_bytes_;
    std::uint64_t current_bytes_{0};
    std::uint64_t evictions_{0};
};

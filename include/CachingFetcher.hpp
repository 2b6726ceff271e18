// include/CachingFetcher.hpp
#pragma once
#include "HttpTypes.hpp"

#include <atomic>
#include <cstdint>

class CachePolicy;
class EvictionStore;

// Fetcher decorator: serves cacheable GETs from the store, fills it on
// successful misses, and falls back to a stale copy when the network fails.
class CachingFetcher : public Fetcher {
public:
    CachingFetcher(Fetcher& original, EvictionStore& store, const CachePolicy& policy)
        : original_(original), store_(store), policy_(policy) {}

    HttpResponse fetch(const HttpRequest& req) override;

    Fetcher& original() { return original_; }

    std::uint64_t hits()         const { return hits_.load(std::memory_order_relaxed); }
    std::uint64_t misses()       const { return misses_.load(std::memory_order_relaxed); }
    std::uint64_t bypassed()     const { return bypassed_.load(std::memory_order_relaxed); }
    std::uint64_t stored()       const { return stored_.load(std::memory_order_relaxed); }
    std::uint64_t not_cached()   const { return not_cached_.load(std::memory_order_relaxed); }
    std::uint64_t stale_served() const { return stale_served_.load(std::memory_order_relaxed); }

private:
    Fetcher&           original_;
    EvictionStore&     store_;
    const CachePolicy& policy_;

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> bypassed_{0};
    std::atomic<std::uint64_t> stored_{0};
    std::atomic<std::uint64_t> not_cached_{0};
    std::atomic<std::uint64_t> stale_served_{0};
};

#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <nlohmann/json_fwd.hpp>

class MetaStore;

// Snapshot handed to the diagnostics overlay.
struct CacheStats {
    std::size_t   cachedCount = 0;
    std::uint64_t totalBytes = 0;
    std::uint64_t maxBytes = 0;
    std::uint64_t hitCount = 0;
    std::uint64_t missCount = 0;
    std::uint64_t bypassedCount = 0;
    std::uint64_t evictionCount = 0;
    std::uint64_t storedCount = 0;       // successful stores on the miss path
    std::uint64_t notCachedCount = 0;    // rejected by the store (oversized)
    std::uint64_t staleServedCount = 0;  // stale copies served after a fetch failure
    double        hitRate = 0.0;         // hits / (hits + misses)
    std::uint64_t prewarmedCount = 0;
    std::uint64_t prewarmFailedCount = 0;
    bool          isPrewarming = false;
    std::size_t   discoveredAssetCount = 0;
};

double compute_hit_rate(std::uint64_t hits, std::uint64_t misses);

void to_json(nlohmann::json& j, const CacheStats& s);
void from_json(const nlohmann::json& j, CacheStats& s);

// Best-effort snapshot under MetaStore::kCacheStatsKey; not authoritative.
bool save_cache_stats(MetaStore& meta, const CacheStats& stats);
std::optional<CacheStats> load_cache_stats(const MetaStore& meta);

// === src/CacheStats/CacheStats.cpp ===
#include "CacheStats.hpp"
#include "MetaStore.hpp"
#include "Logger.hpp"

#include <nlohmann/json.hpp>
using nlohmann::json;


double compute_hit_rate(std::uint64_t hits, std::uint64_t misses) {
    const std::uint64_t lookups = hits + misses;
    if (lookups == 0) return 0.0;
    return static_cast<double>(hits) / static_cast<double>(lookups);
}


void to_json(json& j, const CacheStats& s) {
    j = json{
        {"cachedCount",          s.cachedCount},
        {"totalBytes",           s.totalBytes},
        {"maxBytes",             s.maxBytes},
        {"hitCount",             s.hitCount},
        {"missCount",            s.missCount},
        {"bypassedCount",        s.bypassedCount},
        {"evictionCount",        s.evictionCount},
        {"storedCount",          s.storedCount},
        {"notCachedCount",       s.notCachedCount},
        {"staleServedCount",     s.staleServedCount},
        {"hitRate",              s.hitRate},
        {"prewarmedCount",       s.prewarmedCount},
        {"prewarmFailedCount",   s.prewarmFailedCount},
        {"isPrewarming",         s.isPrewarming},
        {"discoveredAssetCount", s.discoveredAssetCount},
    };
}

// Missing fields keep their defaults so older snapshots still load.
void from_json(const json& j, CacheStats& s) {
    s.cachedCount          = j.value("cachedCount", s.cachedCount);
    s.totalBytes           = j.value("totalBytes", s.totalBytes);
    s.maxBytes             = j.value("maxBytes", s.maxBytes);
    s.hitCount             = j.value("hitCount", s.hitCount);
    s.missCount            = j.value("missCount", s.missCount);
    s.bypassedCount        = j.value("bypassedCount", s.bypassedCount);
    s.evictionCount        = j.value("evictionCount", s.evictionCount);
    s.storedCount          = j.value("storedCount", s.storedCount);
    s.notCachedCount       = j.value("notCachedCount", s.notCachedCount);
    s.staleServedCount     = j.value("staleServedCount", s.staleServedCount);
    s.hitRate              = j.value("hitRate", s.hitRate);
    s.prewarmedCount       = j.value("prewarmedCount", s.prewarmedCount);
    s.prewarmFailedCount   = j.value("prewarmFailedCount", s.prewarmFailedCount);
    s.isPrewarming         = j.value("isPrewarming", s.isPrewarming);
    s.discoveredAssetCount = j.value("discoveredAssetCount", s.discoveredAssetCount);
}


// Desc: persist a statistics snapshot (write failures are only logged)
// In: MetaStore& meta, const CacheStats& stats
// Out: bool
bool save_cache_stats(MetaStore& meta, const CacheStats& stats) {
    const json j = stats;
    return meta.put(MetaStore::kCacheStatsKey, j.dump());
}

// Desc: load the last snapshot; absent or corrupt data yields nullopt
// In: const MetaStore& meta
// Out: std::optional<CacheStats>
std::optional<CacheStats> load_cache_stats(const MetaStore& meta) {
    const auto raw = meta.get(MetaStore::kCacheStatsKey);
    if (!raw) return std::nullopt;

    try {
        const json j = json::parse(*raw);
        if (!j.is_object()) return std::nullopt;
        return j.get<CacheStats>();
    } catch (const json::exception& e) {
        Logger::warn("CacheStats", std::string("ignoring corrupt stats snapshot: ") + e.what());
        return std::nullopt;
    }
}

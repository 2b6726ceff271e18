// === src/CacheEngine/CacheEngine.cpp ===
#include "CacheEngine.hpp"
#include "ConfigManager.hpp"
#include "Discovery.hpp"
#include "Logger.hpp"
#include "MetaStore.hpp"


CacheEngine::CacheEngine(const ConfigManager& config, MetaStore& meta, Fetcher& network,
                         IdleScheduler* scheduler)
    : config_(config),
      meta_(meta),
      network_(network),
      owned_scheduler_(scheduler ? std::unique_ptr<BackgroundIdleScheduler>()
                                 : std::make_unique<BackgroundIdleScheduler>()),
      scheduler_(scheduler ? scheduler : owned_scheduler_.get()),
      store_(config.max_cache_bytes()),
      caching_(network, store_, policy_),
      prewarmer_(network, store_, policy_, *scheduler_) {
    if (!policy_.buildFromConfig(config_)) {
        Logger::error("CacheEngine", "cache policy unavailable, all requests will bypass the cache");
    }
}

CacheEngine::~CacheEngine() {
    if (owned_scheduler_) owned_scheduler_->stop();
}


// Desc: run the version guard and install the caching fetcher (idempotent)
// In: const std::string& build_id
// Out: VersionStatus
VersionStatus CacheEngine::init(const std::string& build_id) {
    if (initialized_.load()) {
        Logger::warn("CacheEngine", "already initialized, ignoring repeated init");
        return version_status_;
    }

    version_status_ = VersionGuard::check(meta_, build_id);
    discovered_ = Discovery::load(meta_);

    if (owned_scheduler_) {
        owned_scheduler_->start(static_cast<std::size_t>(config_.prewarm_concurrency()));
    }

    initialized_.store(true);
    Logger::info("CacheEngine", "initialized with " + std::to_string(store_.max_bytes() / (1024 * 1024))
                 + " MB limit, build " + VersionGuard::to_string(version_status_)
                 + ", " + std::to_string(discovered_.size()) + " discovered assets");
    return version_status_;
}


Fetcher& CacheEngine::fetcher() {
    if (initialized_.load()) return caching_;
    return network_;
}


// Desc: prewarm from persisted discovery data when it is still trustworthy
// In: const Prewarmer::ProgressFn& on_progress
// Out: bool (true if a run was attempted)
bool CacheEngine::auto_prewarm(const Prewarmer::ProgressFn& on_progress) {
    if (!initialized_.load()) {
        Logger::warn("CacheEngine", "auto prewarm before init, skipped");
        return false;
    }
    if (!config_.auto_prewarm()) return false;
    if (version_status_ == VersionStatus::Changed) {
        Logger::info("CacheEngine", "build changed, auto prewarm skipped");
        return false;
    }
    if (discovered_.empty()) {
        Logger::info("CacheEngine", "no discovered assets, cache will populate on demand");
        return false;
    }
    (void)prewarmer_.prewarm(discovered_, config_.prewarm_concurrency(), on_progress);
    return true;
}

PrewarmResult CacheEngine::prewarm(const std::vector<std::string>& urls,
                                   const Prewarmer::ProgressFn& on_progress) {
    return prewarmer_.prewarm(urls, config_.prewarm_concurrency(), on_progress);
}

PrewarmResult CacheEngine::prewarm_from_manifest(const std::string& manifest_url,
                                                 const Prewarmer::ProgressFn& on_progress) {
    return prewarmer_.prewarm_from_manifest(manifest_url, config_.prewarm_concurrency(), on_progress);
}


// Desc: persist cached + discovered URLs for the next session
// In: const std::vector<std::string>& urls
// Out: bool
bool CacheEngine::record_discovered(const std::vector<std::string>& urls) {
    const bool ok = Discovery::record(meta_, store_, urls, config_.discovered_cap());
    if (ok) discovered_ = Discovery::load(meta_);
    return ok;
}


CacheStats CacheEngine::stats() const {
    CacheStats s;
    s.cachedCount          = store_.size();
    s.totalBytes           = store_.current_bytes();
    s.maxBytes             = store_.max_bytes();
    s.hitCount             = caching_.hits();
    s.missCount            = caching_.misses();
    s.bypassedCount        = caching_.bypassed();
    s.evictionCount        = store_.eviction_count();
    s.storedCount          = caching_.stored();
    s.notCachedCount       = caching_.not_cached();
    s.staleServedCount     = caching_.stale_served();
    s.hitRate              = compute_hit_rate(s.hitCount, s.missCount);
    s.prewarmedCount       = prewarmer_.prewarmed_count();
    s.prewarmFailedCount   = prewarmer_.failed_count();
    s.isPrewarming         = prewarmer_.is_running();
    s.discoveredAssetCount = discovered_.size();
    return s;
}

bool CacheEngine::persist_stats() {
    return save_cache_stats(meta_, stats());
}


// Desc: drop every cached entry, optionally the persisted metadata too
// In: bool include_persisted
// Out: void
void CacheEngine::clear(bool include_persisted) {
    store_.clear();
    if (include_persisted) {
        if (!meta_.erase(MetaStore::kDiscoveredAssetsKey) ||
            !meta_.erase(MetaStore::kCacheStatsKey)) {
            Logger::warn("CacheEngine", "persisted metadata could not be cleared");
        }
        discovered_.clear();
    }
    Logger::info("CacheEngine", include_persisted ? "cache and persisted data cleared" : "cache cleared");
}

#ifndef CACHE_ENGINE_HPP
#define CACHE_ENGINE_HPP
#pragma once
#include "CachePolicy.hpp"
#include "CacheStats.hpp"
#include "CachingFetcher.hpp"
#include "EvictionStore.hpp"
#include "IdleScheduler.hpp"
#include "Prewarmer.hpp"
#include "VersionGuard.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

class ConfigManager;
class MetaStore;

// One per process: owns the store and wires policy, interception and
// prewarming together. Construct it at startup and pass it by reference.
class CacheEngine {
public:
    CacheEngine(const ConfigManager& config, MetaStore& meta, Fetcher& network,
                IdleScheduler* scheduler = nullptr);
    ~CacheEngine();

    CacheEngine(const CacheEngine&) = delete;
    CacheEngine& operator=(const CacheEngine&) = delete;

    // Version guard + interceptor install. Second call warns and returns
    // the status of the first.
    VersionStatus init(const std::string& build_id);
    bool initialized() const { return initialized_.load(); }

    // Call sites fetch through this; before init it is the network fetcher.
    Fetcher& fetcher();

    // Runs only when enabled, the build did not change, and discovery data exists.
    bool auto_prewarm(const Prewarmer::ProgressFn& on_progress = nullptr);
    PrewarmResult prewarm(const std::vector<std::string>& urls,
                          const Prewarmer::ProgressFn& on_progress = nullptr);
    PrewarmResult prewarm_from_manifest(const std::string& manifest_url,
                                        const Prewarmer::ProgressFn& on_progress = nullptr);
    void stop_prewarm() { prewarmer_.stop(); }

    bool record_discovered(const std::vector<std::string>& urls);
    const std::vector<std::string>& discovered() const { return discovered_; }

    CacheStats stats() const;
    bool persist_stats();
    void clear(bool include_persisted);

    EvictionStore& store() { return store_; }
    const CachePolicy& policy() const { return policy_; }

private:
    const ConfigManager& config_;
    MetaStore&           meta_;
    Fetcher&             network_;

    std::unique_ptr<BackgroundIdleScheduler> owned_scheduler_;
    IdleScheduler*                           scheduler_;

    EvictionStore  store_;
    CachePolicy    policy_;
    CachingFetcher caching_;
    Prewarmer      prewarmer_;

    std::atomic<bool>        initialized_{false};
    VersionStatus            version_status_ = VersionStatus::Unchanged;
    std::vector<std::string> discovered_;
};

#endif // CACHE_ENGINE_HPP

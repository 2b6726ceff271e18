#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

class CachePolicy;
class EvictionStore;
class Fetcher;
class IdleScheduler;

struct PrewarmProgress {
    std::size_t completed = 0;  // success + failed so far
    std::size_t failed = 0;
    std::size_t total = 0;
    int         percent = 0;
};

struct PrewarmResult {
    std::size_t success = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;   // not cacheable, already cached or duplicate
    std::size_t total = 0;     // eligible urls
    bool        rejected = false;  // another run was active
};

// Fills the store ahead of demand in batches of `concurrency` fetches, each
// batch handed to the idle scheduler and awaited before the next one.
class Prewarmer {
public:
    using ProgressFn = std::function<void(const PrewarmProgress&)>;

    // `original` must be the non-intercepted fetcher.
    Prewarmer(Fetcher& original, EvictionStore& store, const CachePolicy& policy,
              IdleScheduler& scheduler)
        : original_(original), store_(store), policy_(policy), scheduler_(scheduler) {}

    PrewarmResult prewarm(const std::vector<std::string>& urls, int concurrency,
                          const ProgressFn& on_progress = nullptr);

    // Fetch a JSON manifest ({"preload": [...]}) and prewarm its entries.
    PrewarmResult prewarm_from_manifest(const std::string& manifest_url, int concurrency,
                                        const ProgressFn& on_progress = nullptr);

    // No further batches are scheduled; the batch in flight completes.
    void stop() { stop_requested_.store(true); }

    bool          is_running()      const { return running_.load(); }
    std::uint64_t prewarmed_count() const { return prewarmed_.load(); }
    std::uint64_t failed_count()    const { return failed_.load(); }

private:
    bool fetch_and_store(const std::string& url);

    Fetcher&           original_;
    EvictionStore&     store_;
    const CachePolicy& policy_;
    IdleScheduler&     scheduler_;

    std::atomic<bool>          running_{false};
    std::atomic<bool>          stop_requested_{false};
    std::atomic<std::uint64_t> prewarmed_{0};
    std::atomic<std::uint64_t> failed_{0};
};

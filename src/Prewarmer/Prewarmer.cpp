#include "Prewarmer.hpp"
#include "CachePolicy.hpp"
#include "Discovery.hpp"
#include "EvictionStore.hpp"
#include "HttpTypes.hpp"
#include "IdleScheduler.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <nlohmann/json.hpp>
using nlohmann::json;


namespace {

// Counts down once per finished fetch; the run thread waits for zero.
class BatchLatch {
public:
    explicit BatchLatch(std::size_t count) : count_(count) {}
    void count_down() {
        std::lock_guard<std::mutex> lk(m_);
        if (count_ > 0) --count_;
        if (count_ == 0) cv_.notify_all();
    }
    void wait() {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [&]{ return count_ == 0; });
    }
private:
    std::mutex m_;
    std::condition_variable cv_;
    std::size_t count_;
};

// Clears the running flag on every exit path.
struct RunGuard {
    std::atomic<bool>& flag;
    ~RunGuard() { flag.store(false); }
};

}


// Desc: fetch one URL through the original fetcher and store it
// In: const std::string& url
// Out: bool (true if stored or too large but fetched fine)
bool Prewarmer::fetch_and_store(const std::string& url) {
    HttpRequest req;
    req.url = url;
    try {
        HttpResponse resp = original_.fetch(req);
        if (!resp.ok()) {
            Logger::warn("Prewarmer", "failed to prewarm " + url + ": HTTP " + std::to_string(resp.status));
            return false;
        }
        const std::uint64_t size = estimate_size(resp);
        if (!store_.set(url, resp, size)) {
            Logger::info("Prewarmer", "too large to cache: " + url);
        }
        return true;
    } catch (const std::exception& e) {
        Logger::warn("Prewarmer", "failed to prewarm " + url + ": " + e.what());
        return false;
    }
}


// Desc: prewarm eligible URLs in bounded, idle-scheduled batches
// In: const std::vector<std::string>& urls, int concurrency, const ProgressFn& on_progress
// Out: PrewarmResult
PrewarmResult Prewarmer::prewarm(const std::vector<std::string>& urls, int concurrency,
                                 const ProgressFn& on_progress) {
    PrewarmResult result;
    if (running_.exchange(true)) {
        Logger::warn("Prewarmer", "prewarm already running, request rejected");
        result.rejected = true;
        return result;
    }
    RunGuard guard{running_};
    stop_requested_.store(false);

    if (concurrency < 1) concurrency = 1;

    // 1) filter
    std::vector<std::string> todo;
    std::unordered_set<std::string> seen;
    for (const auto& raw : urls) {
        const std::string url = canonical_url(raw);
        if (!seen.insert(url).second ||
            !policy_.should_cache(url, "GET") ||
            store_.contains(url)) {
            ++result.skipped;
            continue;
        }
        todo.push_back(url);
    }
    result.total = todo.size();

    Logger::info("Prewarmer", "prewarming " + std::to_string(result.total) + " assets ("
                 + std::to_string(result.skipped) + " skipped, concurrency "
                 + std::to_string(concurrency) + ")");

    // 2) batches
    const std::size_t batch_size = static_cast<std::size_t>(concurrency);
    for (std::size_t start = 0; start < todo.size(); start += batch_size) {
        if (stop_requested_.load()) {
            Logger::info("Prewarmer", "stop requested, remaining batches dropped");
            break;
        }

        const std::size_t end = std::min(start + batch_size, todo.size());
        auto latch = std::make_shared<BatchLatch>(end - start);
        auto batch_ok = std::make_shared<std::atomic<std::size_t>>(0);
        auto batch_failed = std::make_shared<std::atomic<std::size_t>>(0);

        for (std::size_t i = start; i < end; ++i) {
            const std::string url = todo[i];
            const bool accepted = scheduler_.schedule([this, url, latch, batch_ok, batch_failed]() {
                if (fetch_and_store(url)) batch_ok->fetch_add(1);
                else                      batch_failed->fetch_add(1);
                latch->count_down();
            });
            if (!accepted) {
                Logger::warn("Prewarmer", "idle scheduler unavailable, " + url + " not prewarmed");
                batch_failed->fetch_add(1);
                latch->count_down();
            }
        }
        latch->wait();

        result.success += batch_ok->load();
        result.failed += batch_failed->load();
        prewarmed_.fetch_add(batch_ok->load());
        failed_.fetch_add(batch_failed->load());

        if (on_progress) {
            PrewarmProgress p;
            p.completed = result.success + result.failed;
            p.failed = result.failed;
            p.total = result.total;
            p.percent = static_cast<int>(p.completed * 100 / result.total);
            on_progress(p);
        }
    }

    Logger::info("Prewarmer", "prewarm complete: " + std::to_string(result.success) + "/"
                 + std::to_string(result.total) + " (" + std::to_string(result.failed) + " failed)");
    return result;
}


// Desc: load a preload manifest and prewarm its entries
// In: const std::string& manifest_url, int concurrency, const ProgressFn& on_progress
// Out: PrewarmResult (empty run if the manifest is missing or invalid)
PrewarmResult Prewarmer::prewarm_from_manifest(const std::string& manifest_url, int concurrency,
                                               const ProgressFn& on_progress) {
    if (is_running()) {
        Logger::warn("Prewarmer", "prewarm already running, manifest request rejected");
        PrewarmResult rejected;
        rejected.rejected = true;
        return rejected;
    }

    HttpRequest req;
    req.url = manifest_url;

    std::vector<std::string> urls;
    try {
        const HttpResponse resp = original_.fetch(req);
        if (!resp.ok()) {
            Logger::info("Prewarmer", "no manifest at " + manifest_url + " (HTTP " + std::to_string(resp.status) + ")");
            return {};
        }
        const json j = json::parse(resp.body);
        if (!j.is_object() || !j.contains("preload") || !j["preload"].is_array()) {
            Logger::warn("Prewarmer", "manifest has no 'preload' array: " + manifest_url);
            return {};
        }
        for (const auto& v : j["preload"]) {
            if (!v.is_string()) continue;
            const std::string url = Discovery::resolve_url(manifest_url, v.get<std::string>());
            if (!url.empty()) urls.push_back(url);
        }
    } catch (const FetchError& e) {
        Logger::warn("Prewarmer", std::string("manifest fetch failed: ") + e.what());
        return {};
    } catch (const json::exception& e) {
        Logger::warn("Prewarmer", std::string("manifest is not valid JSON: ") + e.what());
        return {};
    }

    Logger::info("Prewarmer", "found " + std::to_string(urls.size()) + " assets in manifest");
    return prewarm(urls, concurrency, on_progress);
}

#include "CachingFetcher.hpp"
#include "CachePolicy.hpp"
#include "EvictionStore.hpp"
#include "Logger.hpp"


// Desc: intercepted request path (bypass / hit / miss+store / stale fallback)
// In: const HttpRequest& req
// Out: HttpResponse (independent copy); rethrows FetchError when nothing stale exists
HttpResponse CachingFetcher::fetch(const HttpRequest& req) {
    if (!policy_.should_cache(req)) {
        bypassed_.fetch_add(1, std::memory_order_relaxed);
        return original_.fetch(req);
    }

    const std::string key = canonical_url(req.url);

    if (auto cached = store_.get(key)) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        #ifdef DEBUG
        Logger::info("CachingFetcher", "hit " + key);
        #endif
        return std::move(*cached);
    }

    misses_.fetch_add(1, std::memory_order_relaxed);

    HttpResponse resp;
    try {
        resp = original_.fetch(req);
    } catch (const FetchError& e) {
        if (auto stale = store_.peek(key)) {
            stale_served_.fetch_add(1, std::memory_order_relaxed);
            Logger::warn("CachingFetcher", "network failed for " + key + " (" + e.what() + "), serving stale copy");
            return std::move(*stale);
        }
        throw;
    }

    if (resp.ok()) {
        // One copy goes into the store, the caller keeps resp.
        if (store_.set(key, resp, estimate_size(resp))) {
            stored_.fetch_add(1, std::memory_order_relaxed);
        } else {
            not_cached_.fetch_add(1, std::memory_order_relaxed);
            Logger::info("CachingFetcher", "too large to cache: " + key);
        }
    }
    return resp;
}

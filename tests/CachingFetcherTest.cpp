// tests/CachingFetcherTest.cpp
#include <gtest/gtest.h>
#include "CachePolicy.hpp"
#include "CachingFetcher.hpp"
#include "EvictionStore.hpp"
#include "FakeFetcher.hpp"

namespace {

const char* kSprite = "https://game.example/img/sprite.png";

class CachingFetcherTest : public ::testing::Test {
protected:
    CachingFetcherTest() : store(1024), caching(net, store, policy) {}

    void SetUp() override {
        ASSERT_TRUE(policy.build(CachePolicy::default_never_cache_patterns(),
                                 CachePolicy::default_static_patterns()));
    }

    HttpResponse get(const std::string& url) {
        HttpRequest req;
        req.url = url;
        return caching.fetch(req);
    }

    FakeFetcher net;
    EvictionStore store;
    CachePolicy policy;
    CachingFetcher caching;
};

} // namespace

TEST_F(CachingFetcherTest, MissStoresThenHitSkipsNetwork)
{
    net.route(kSprite, "pixels");

    EXPECT_EQ(get(kSprite).body, "pixels");
    EXPECT_EQ(get(kSprite).body, "pixels");

    EXPECT_EQ(net.calls(), 1);
    EXPECT_EQ(caching.misses(), 1u);
    EXPECT_EQ(caching.hits(), 1u);
    EXPECT_EQ(caching.stored(), 1u);
    EXPECT_TRUE(store.contains(kSprite));
}

TEST_F(CachingFetcherTest, FragmentSharesCacheSlot)
{
    net.route(kSprite, "pixels");

    get(std::string(kSprite) + "#a");
    get(kSprite);

    EXPECT_EQ(net.calls(), 1);
    EXPECT_EQ(caching.hits(), 1u);
}

TEST_F(CachingFetcherTest, NonCacheableRequestsBypass)
{
    const std::string api = "https://game.example/api/profile";
    net.route(api, "{}");

    get(api);
    get(api);

    HttpRequest post;
    post.method = "POST";
    post.url = kSprite;
    post.body = "upload";
    net.route(kSprite, "pixels");
    caching.fetch(post);

    EXPECT_EQ(net.calls(), 3);
    EXPECT_EQ(caching.bypassed(), 3u);
    EXPECT_EQ(caching.hits() + caching.misses(), 0u);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(CachingFetcherTest, ErrorStatusIsReturnedButNotStored)
{
    const HttpResponse r = get(kSprite);
    EXPECT_EQ(r.status, 404);
    get(kSprite);

    EXPECT_EQ(net.calls(), 2);
    EXPECT_EQ(caching.misses(), 2u);
    EXPECT_EQ(caching.stored(), 0u);
    EXPECT_FALSE(store.contains(kSprite));
}

TEST_F(CachingFetcherTest, OversizedResponseIsServedButNotCached)
{
    net.route(kSprite, std::string(4096, 'x'));

    EXPECT_EQ(get(kSprite).body.size(), 4096u);
    EXPECT_EQ(caching.not_cached(), 1u);
    EXPECT_FALSE(store.contains(kSprite));
}

TEST_F(CachingFetcherTest, NetworkFailureServesStaleCopy)
{
    net.fail(kSprite);
    // Another writer (a prewarm worker) fills the slot while the request is in flight.
    net.before = [this](const HttpRequest&) {
        HttpResponse stale;
        stale.status = 200;
        stale.body = "old pixels";
        store.set(kSprite, stale, stale.body.size());
    };

    const HttpResponse r = get(kSprite);
    EXPECT_EQ(r.body, "old pixels");
    EXPECT_EQ(caching.stale_served(), 1u);
}

TEST_F(CachingFetcherTest, NetworkFailureWithoutCopyPropagates)
{
    net.fail(kSprite);
    EXPECT_THROW(get(kSprite), FetchError);
    EXPECT_EQ(caching.stale_served(), 0u);

    const std::string api = "https://game.example/api/profile";
    net.fail(api);
    EXPECT_THROW(get(api), FetchError);
}

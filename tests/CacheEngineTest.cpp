// tests/CacheEngineTest.cpp
#include <gtest/gtest.h>
#include "CacheEngine.hpp"
#include "ConfigManager.hpp"
#include "Discovery.hpp"
#include "FakeFetcher.hpp"
#include "MetaStore.hpp"

#include <memory>

namespace {

const char* kHero = "https://game.example/img/hero.png";
const char* kMap  = "https://game.example/maps/level1.json";

class CacheEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(meta.open(":memory:"));
        ASSERT_TRUE(config.loadFromString(R"({"max_cache_size": "1MB", "prewarm_concurrency": 2})"));
        net.route(kHero, "hero pixels");
        net.route(kMap, R"({"w": 10})");
    }

    std::unique_ptr<CacheEngine> session() {
        return std::make_unique<CacheEngine>(config, meta, net);
    }

    HttpResponse get(CacheEngine& engine, const std::string& url) {
        HttpRequest req;
        req.url = url;
        return engine.fetcher().fetch(req);
    }

    MetaStore meta;
    ConfigManager config;
    FakeFetcher net;
};

} // namespace

TEST_F(CacheEngineTest, InitInstallsCachingFetcherOnce)
{
    auto engine = session();
    EXPECT_EQ(&engine->fetcher(), &net);
    EXPECT_FALSE(engine->initialized());

    EXPECT_EQ(engine->init("v1"), VersionStatus::Unchanged);
    EXPECT_TRUE(engine->initialized());
    Fetcher* installed = &engine->fetcher();
    EXPECT_NE(installed, &net);

    EXPECT_EQ(engine->init("v2"), VersionStatus::Unchanged);
    EXPECT_EQ(&engine->fetcher(), installed);
    EXPECT_EQ(meta.get(MetaStore::kBuildVersionKey).value_or(""), "v1");
}

TEST_F(CacheEngineTest, StatsReflectTraffic)
{
    auto engine = session();
    engine->init("v1");

    get(*engine, kHero);
    get(*engine, kHero);
    get(*engine, "https://game.example/api/me");

    const CacheStats s = engine->stats();
    EXPECT_EQ(s.cachedCount, 1u);
    EXPECT_EQ(s.hitCount, 1u);
    EXPECT_EQ(s.missCount, 1u);
    EXPECT_EQ(s.bypassedCount, 1u);
    EXPECT_EQ(s.storedCount, 1u);
    EXPECT_DOUBLE_EQ(s.hitRate, 0.5);
    EXPECT_EQ(s.maxBytes, 1024u * 1024u);
    EXPECT_GT(s.totalBytes, 0u);
    EXPECT_FALSE(s.isPrewarming);

    ASSERT_TRUE(engine->persist_stats());
    ASSERT_TRUE(load_cache_stats(meta).has_value());
    EXPECT_EQ(load_cache_stats(meta)->hitCount, 1u);
}

TEST_F(CacheEngineTest, SameBuildAutoPrewarmsDiscoveredAssets)
{
    {
        auto first = session();
        first->init("v1");
        get(*first, kHero);
        ASSERT_TRUE(first->record_discovered({kMap}));
        EXPECT_EQ(first->discovered().size(), 2u);
    }
    const int calls_before = net.calls();

    auto second = session();
    EXPECT_EQ(second->init("v1"), VersionStatus::Unchanged);
    EXPECT_EQ(second->discovered().size(), 2u);
    EXPECT_TRUE(second->auto_prewarm());

    EXPECT_EQ(net.calls() - calls_before, 2);
    EXPECT_TRUE(second->store().contains(kHero));
    EXPECT_TRUE(second->store().contains(kMap));
    EXPECT_EQ(second->stats().prewarmedCount, 2u);

    get(*second, kHero);
    EXPECT_EQ(second->stats().hitCount, 1u);
}

TEST_F(CacheEngineTest, NewBuildSkipsAutoPrewarm)
{
    {
        auto first = session();
        first->init("v1");
        ASSERT_TRUE(first->record_discovered({kHero, kMap}));
    }
    const int calls_before = net.calls();

    auto second = session();
    EXPECT_EQ(second->init("v2"), VersionStatus::Changed);
    EXPECT_TRUE(second->discovered().empty());
    EXPECT_FALSE(meta.get(MetaStore::kDiscoveredAssetsKey).has_value());
    EXPECT_FALSE(second->auto_prewarm());
    EXPECT_EQ(net.calls(), calls_before);
}

TEST_F(CacheEngineTest, AutoPrewarmGating)
{
    auto engine = session();
    EXPECT_FALSE(engine->auto_prewarm());  // before init

    engine->init("v1");
    EXPECT_FALSE(engine->auto_prewarm());  // nothing discovered

    ConfigManager manual;
    ASSERT_TRUE(manual.loadFromString(R"({"auto_prewarm": false})"));
    ASSERT_TRUE(Discovery::record(meta, engine->store(), {kHero}));
    CacheEngine disabled(manual, meta, net);
    disabled.init("v1");
    EXPECT_EQ(disabled.discovered().size(), 1u);
    EXPECT_FALSE(disabled.auto_prewarm());
    EXPECT_EQ(net.calls(), 0);
}

TEST_F(CacheEngineTest, ExplicitPrewarm)
{
    auto engine = session();
    engine->init("v1");

    const PrewarmResult r = engine->prewarm({kHero, kMap, "https://game.example/index.html"});
    EXPECT_EQ(r.total, 2u);
    EXPECT_EQ(r.success, 2u);
    EXPECT_EQ(r.skipped, 1u);

    get(*engine, kMap);
    EXPECT_EQ(engine->stats().hitCount, 1u);
    EXPECT_EQ(net.calls(), 2);
}

TEST_F(CacheEngineTest, ClearDropsEntriesAndOptionallyPersistedData)
{
    auto engine = session();
    engine->init("v1");
    get(*engine, kHero);
    ASSERT_TRUE(engine->record_discovered({kMap}));
    ASSERT_TRUE(engine->persist_stats());

    engine->clear(false);
    EXPECT_EQ(engine->store().size(), 0u);
    EXPECT_TRUE(meta.get(MetaStore::kDiscoveredAssetsKey).has_value());

    engine->clear(true);
    EXPECT_TRUE(engine->discovered().empty());
    EXPECT_FALSE(meta.get(MetaStore::kDiscoveredAssetsKey).has_value());
    EXPECT_FALSE(meta.get(MetaStore::kCacheStatsKey).has_value());
    EXPECT_EQ(meta.get(MetaStore::kBuildVersionKey).value_or(""), "v1");
}

TEST(CacheEngine, ExternalSchedulerIsUsed)
{
    MetaStore meta;
    ASSERT_TRUE(meta.open(":memory:"));
    ConfigManager config;
    FakeFetcher net;
    net.route(kHero, "hero pixels");

    BackgroundIdleScheduler scheduler;
    scheduler.start(1);
    CacheEngine engine(config, meta, net, &scheduler);
    engine.init("v1");

    EXPECT_EQ(engine.prewarm({kHero}).success, 1u);
    scheduler.stop();
    EXPECT_EQ(engine.prewarm({kMap}).failed, 1u);
}

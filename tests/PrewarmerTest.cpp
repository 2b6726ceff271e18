// tests/PrewarmerTest.cpp
#include <gtest/gtest.h>
#include "CachePolicy.hpp"
#include "EvictionStore.hpp"
#include "FakeFetcher.hpp"
#include "IdleScheduler.hpp"
#include "Prewarmer.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

namespace {

// Accepts nothing, like a scheduler that has been shut down.
class RefusingScheduler : public IdleScheduler {
public:
    bool schedule(Task) override { return false; }
};

std::string asset(int i) {
    return "https://game.example/assets/tile" + std::to_string(i) + ".png";
}

class PrewarmerTest : public ::testing::Test {
protected:
    PrewarmerTest() : store(1 << 20), prewarmer(net, store, policy, scheduler) {}

    void SetUp() override {
        ASSERT_TRUE(policy.build(CachePolicy::default_never_cache_patterns(),
                                 CachePolicy::default_static_patterns()));
        scheduler.start(4);
    }
    void TearDown() override {
        scheduler.stop();
    }

    FakeFetcher net;
    EvictionStore store;
    CachePolicy policy;
    BackgroundIdleScheduler scheduler;
    Prewarmer prewarmer;
};

} // namespace

TEST_F(PrewarmerTest, NeverExceedsConcurrency)
{
    std::vector<std::string> urls;
    for (int i = 0; i < 5; ++i) {
        urls.push_back(asset(i));
        net.route(asset(i), "tile");
    }
    net.delay = std::chrono::milliseconds(20);

    const PrewarmResult r = prewarmer.prewarm(urls, 2);

    EXPECT_LE(net.max_in_flight(), 2);
    EXPECT_GE(net.max_in_flight(), 1);
    EXPECT_EQ(r.total, 5u);
    EXPECT_EQ(r.success, 5u);
    EXPECT_EQ(r.failed, 0u);
    for (const auto& u : urls) EXPECT_TRUE(store.contains(u)) << u;
    EXPECT_EQ(prewarmer.prewarmed_count(), 5u);
    EXPECT_FALSE(prewarmer.is_running());
}

TEST_F(PrewarmerTest, CountsFailuresAndReportsProgress)
{
    net.route(asset(0), "ok");
    net.route(asset(1), "gone", 500);
    net.fail(asset(2));
    net.route(asset(3), "ok");
    // asset(4) has no route: 404

    std::vector<PrewarmProgress> progress;
    const PrewarmResult r = prewarmer.prewarm(
        {asset(0), asset(1), asset(2), asset(3), asset(4)}, 2,
        [&](const PrewarmProgress& p) { progress.push_back(p); });

    EXPECT_EQ(r.success, 2u);
    EXPECT_EQ(r.failed, 3u);
    EXPECT_EQ(r.success + r.failed, r.total);
    EXPECT_EQ(prewarmer.failed_count(), 3u);

    ASSERT_EQ(progress.size(), 3u);
    EXPECT_EQ(progress[0].completed, 2u);
    EXPECT_EQ(progress.back().completed, 5u);
    EXPECT_EQ(progress.back().percent, 100);
    EXPECT_EQ(progress.back().failed, 3u);
}

TEST_F(PrewarmerTest, SkipsIneligibleUrls)
{
    HttpResponse cached;
    cached.status = 200;
    cached.body = "cached";
    ASSERT_TRUE(store.set(asset(0), cached, 6));
    net.route(asset(1), "tile");

    bool called = false;
    const PrewarmResult r = prewarmer.prewarm(
        {asset(0),                                  // already cached
         asset(1), asset(1) + "#dup",               // duplicate after canonicalisation
         "https://game.example/api/state.json",     // never-cache
         "https://game.example/index.html"},        // not a static asset
        3, [&](const PrewarmProgress&) { called = true; });

    EXPECT_EQ(r.total, 1u);
    EXPECT_EQ(r.skipped, 4u);
    EXPECT_EQ(r.success, 1u);
    EXPECT_EQ(net.calls(), 1);
    EXPECT_TRUE(called);

    called = false;
    const PrewarmResult again = prewarmer.prewarm({asset(0), asset(1)}, 3,
        [&](const PrewarmProgress&) { called = true; });
    EXPECT_EQ(again.total, 0u);
    EXPECT_FALSE(called);
}

TEST_F(PrewarmerTest, OversizedAssetCountsAsSuccess)
{
    EvictionStore tiny(16);
    Prewarmer small(net, tiny, policy, scheduler);
    net.route(asset(0), std::string(1024, 'x'));

    const PrewarmResult r = small.prewarm({asset(0)}, 1);
    EXPECT_EQ(r.success, 1u);
    EXPECT_FALSE(tiny.contains(asset(0)));
}

TEST_F(PrewarmerTest, RejectsConcurrentRun)
{
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    net.route(asset(0), "tile");
    net.before = [gate](const HttpRequest&) { gate.wait(); };

    std::future<PrewarmResult> first = std::async(std::launch::async, [&] {
        return prewarmer.prewarm({asset(0)}, 1);
    });
    while (!prewarmer.is_running()) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    const PrewarmResult second = prewarmer.prewarm({asset(1)}, 1);
    EXPECT_TRUE(second.rejected);
    EXPECT_EQ(second.total, 0u);

    release.set_value();
    const PrewarmResult r = first.get();
    EXPECT_FALSE(r.rejected);
    EXPECT_EQ(r.success, 1u);
    EXPECT_FALSE(prewarmer.is_running());
}

TEST_F(PrewarmerTest, ManifestNotFetchedWhileRunning)
{
    const std::string manifest = "https://game.example/play/preload.json";
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    net.route(asset(0), "tile");
    net.route(manifest, R"({"preload": ["/assets/a.png"]})");
    net.before = [gate](const HttpRequest& req) {
        if (req.url == asset(0)) gate.wait();
    };

    std::future<PrewarmResult> first = std::async(std::launch::async, [&] {
        return prewarmer.prewarm({asset(0)}, 1);
    });
    while (!prewarmer.is_running()) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    const PrewarmResult second = prewarmer.prewarm_from_manifest(manifest, 1);
    EXPECT_TRUE(second.rejected);
    EXPECT_EQ(second.total, 0u);

    release.set_value();
    EXPECT_EQ(first.get().success, 1u);

    const auto seen = net.seen();
    EXPECT_EQ(std::count(seen.begin(), seen.end(), manifest), 0);
}

TEST_F(PrewarmerTest, StopDropsRemainingBatches)
{
    for (int i = 0; i < 5; ++i) net.route(asset(i), "tile");
    net.before = [this](const HttpRequest&) { prewarmer.stop(); };

    const PrewarmResult r = prewarmer.prewarm({asset(0), asset(1), asset(2), asset(3), asset(4)}, 1);

    EXPECT_EQ(r.total, 5u);
    EXPECT_EQ(r.success, 1u);
    EXPECT_EQ(net.calls(), 1);
    EXPECT_FALSE(prewarmer.is_running());
}

TEST_F(PrewarmerTest, RefusedTasksCountAsFailed)
{
    RefusingScheduler refusing;
    Prewarmer p(net, store, policy, refusing);
    net.route(asset(0), "tile");

    const PrewarmResult r = p.prewarm({asset(0), asset(1)}, 2);
    EXPECT_EQ(r.failed, 2u);
    EXPECT_EQ(net.calls(), 0);
}

TEST_F(PrewarmerTest, WarmsFromManifest)
{
    const std::string manifest = "https://game.example/play/preload.json";
    net.route(manifest, R"({"preload": ["/assets/a.png", "img/b.png", "https://cdn.example/sfx/c.mp3", 7]})");
    net.route("https://game.example/assets/a.png", "a");
    net.route("https://game.example/play/img/b.png", "b");
    net.route("https://cdn.example/sfx/c.mp3", "c");

    const PrewarmResult r = prewarmer.prewarm_from_manifest(manifest, 2);

    EXPECT_EQ(r.total, 3u);
    EXPECT_EQ(r.success, 3u);
    EXPECT_TRUE(store.contains("https://game.example/play/img/b.png"));
    EXPECT_FALSE(store.contains(manifest));
}

TEST_F(PrewarmerTest, MissingOrInvalidManifestIsEmptyRun)
{
    const PrewarmResult missing = prewarmer.prewarm_from_manifest("https://game.example/none.json", 2);
    EXPECT_EQ(missing.total, 0u);

    const std::string bad = "https://game.example/bad.json";
    net.route(bad, "{not json");
    EXPECT_EQ(prewarmer.prewarm_from_manifest(bad, 2).total, 0u);

    const std::string wrong = "https://game.example/wrong.json";
    net.route(wrong, R"({"assets": []})");
    EXPECT_EQ(prewarmer.prewarm_from_manifest(wrong, 2).total, 0u);

    const std::string down = "https://game.example/down.json";
    net.fail(down);
    EXPECT_EQ(prewarmer.prewarm_from_manifest(down, 2).total, 0u);
}

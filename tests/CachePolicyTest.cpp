// tests/CachePolicyTest.cpp
#include <gtest/gtest.h>
#include "CachePolicy.hpp"

namespace {

class DefaultPolicy : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(p.build(CachePolicy::default_never_cache_patterns(),
                            CachePolicy::default_static_patterns()));
    }
    CachePolicy p;
};

} // namespace

TEST_F(DefaultPolicy, StaticAssetsAreCacheable)
{
    EXPECT_TRUE(p.should_cache("https://game.example/img/hero.png", "GET"));
    EXPECT_TRUE(p.should_cache("https://game.example/img/hero.PNG", "GET"));
    EXPECT_TRUE(p.should_cache("https://game.example/sfx/jump.ogg", "GET"));
    EXPECT_TRUE(p.should_cache("https://game.example/fonts/ui.woff2", "GET"));
    EXPECT_TRUE(p.should_cache("https://game.example/maps/level1.json", "GET"));
    EXPECT_TRUE(p.should_cache("https://game.example/assets/bundle.bin", "GET"));
    EXPECT_TRUE(p.should_cache("https://game.example/tilesets/forest", "GET"));
}

TEST_F(DefaultPolicy, UnknownResourcesAreNotCacheable)
{
    EXPECT_FALSE(p.should_cache("https://game.example/index.html", "GET"));
    EXPECT_FALSE(p.should_cache("https://game.example/main.js", "GET"));
    EXPECT_FALSE(p.should_cache("", "GET"));
}

TEST_F(DefaultPolicy, NeverCacheRulesWinOverStaticRules)
{
    EXPECT_FALSE(p.should_cache("https://game.example/img/hero.png?v=2", "GET"));
    EXPECT_FALSE(p.should_cache("https://game.example/api/avatar.png", "GET"));
    EXPECT_FALSE(p.should_cache("https://game.example/auth/logo.svg", "GET"));
    EXPECT_FALSE(p.should_cache("https://accounts.google.com/assets/g.png", "GET"));
    EXPECT_FALSE(p.should_cache("wss://game.example/assets/room.json", "GET"));
    EXPECT_FALSE(p.should_cache("https://game.example/socket.io/assets/x.json", "GET"));
    EXPECT_FALSE(p.should_cache("https://game.example/main.hot-update.json", "GET"));
}

TEST_F(DefaultPolicy, OnlyGetIsCacheable)
{
    const std::string url = "https://game.example/img/hero.png";
    EXPECT_TRUE(p.should_cache(url, "get"));
    EXPECT_FALSE(p.should_cache(url, "POST"));
    EXPECT_FALSE(p.should_cache(url, "HEAD"));
    EXPECT_FALSE(p.should_cache(url, "PUT"));
    EXPECT_FALSE(p.should_cache(url, "GETX"));
}

TEST_F(DefaultPolicy, RequestWithBodyOrFragment)
{
    HttpRequest req;
    req.url = "https://game.example/img/hero.png#frame2";
    EXPECT_TRUE(p.should_cache(req));

    req.body = "payload";
    EXPECT_FALSE(p.should_cache(req));
}

TEST(CachePolicy, UnbuiltPolicyCachesNothing)
{
    const CachePolicy p;
    EXPECT_FALSE(p.isReady());
    EXPECT_FALSE(p.should_cache("https://game.example/img/hero.png", "GET"));
}

TEST(CachePolicy, InvalidPatternFailsBuild)
{
    CachePolicy p;
    EXPECT_FALSE(p.build({"("}, CachePolicy::default_static_patterns()));
    EXPECT_FALSE(p.isReady());
    EXPECT_FALSE(p.should_cache("https://game.example/img/hero.png", "GET"));
}

TEST(CachePolicy, CustomRules)
{
    CachePolicy p;
    ASSERT_TRUE(p.build({"/private/"}, {R"(\.bin$)"}));
    EXPECT_EQ(p.patternCount(), 2u);
    EXPECT_TRUE(p.should_cache("https://cdn.example/pack/level.bin", "GET"));
    EXPECT_FALSE(p.should_cache("https://cdn.example/private/level.bin", "GET"));
    EXPECT_FALSE(p.should_cache("https://cdn.example/img/hero.png", "GET"));
}

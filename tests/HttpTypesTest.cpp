// tests/HttpTypesTest.cpp
#include <gtest/gtest.h>
#include "HttpTypes.hpp"

namespace {

HttpResponse with_length(const std::string& body, const std::string& length) {
    HttpResponse r;
    r.status = 200;
    r.body = body;
    r.headers["content-length"] = length;
    return r;
}

} // namespace

TEST(HttpTypes, CanonicalUrlDropsFragment)
{
    EXPECT_EQ(canonical_url("https://g.example/a.png#frame2"), "https://g.example/a.png");
    EXPECT_EQ(canonical_url("https://g.example/a.png?v=3"), "https://g.example/a.png?v=3");
}

TEST(HttpTypes, EstimateSizePrefersDeclaredLength)
{
    EXPECT_EQ(estimate_size(with_length("abc", "4096")), 4096u);

    // smaller than the body, or not a number: measured
    const std::uint64_t measured = 3 + std::string("content-length").size() + 1;
    EXPECT_EQ(estimate_size(with_length("abc", "2")), measured);
    EXPECT_EQ(estimate_size(with_length("abc", "1e3")), std::uint64_t(3 + 14 + 3));
}

TEST(HttpTypes, EstimateSizeIgnoresOverflowingLength)
{
    const std::string huge = "99999999999999999999999";
    const HttpResponse r = with_length("abc", huge);
    EXPECT_EQ(estimate_size(r), std::uint64_t(3 + 14 + huge.size()));

    EXPECT_EQ(estimate_size(with_length("abc", "18446744073709551615")), 18446744073709551615ULL);
    EXPECT_EQ(estimate_size(with_length("abc", "18446744073709551616")), std::uint64_t(3 + 14 + 20));
}

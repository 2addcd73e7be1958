#include "lsp/ResponseCache.hpp"
#include <gtest/gtest.h>

using namespace ada_mcp;
using namespace std::chrono_literals;

class ResponseCacheTest : public ::testing::Test {
protected:
    ResponseCacheTest()
        : cache_(CacheConfig{5000ms, 4}, [this] { return now_; }) {}

    void advance(std::chrono::milliseconds by) { now_ += by; }

    static json hover_params(const std::string& uri, int line) {
        return {{"textDocument", {{"uri", uri}}}, {"position", {{"line", line}, {"character", 0}}}};
    }

    Clock::time_point now_ = Clock::time_point() + std::chrono::hours(1);
    ResponseCache cache_;
};

TEST_F(ResponseCacheTest, InvalidConfigurationRejected) {
    EXPECT_THROW(ResponseCache empty(CacheConfig{1000ms, 0}), std::invalid_argument);
    EXPECT_THROW(ResponseCache clockless(CacheConfig{}, ResponseCache::TimeSource{}), std::invalid_argument);
}

TEST_F(ResponseCacheTest, MissThenHit) {
    EXPECT_FALSE(cache_.get("/p", "ping", json::object()).has_value());

    cache_.put("/p", "ping", json::object(), "pong");

    auto hit = cache_.get("/p", "ping", json::object());
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, "pong");

    CacheStats stats = cache_.stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_DOUBLE_EQ(stats.hit_rate(), 50.0);
}

TEST_F(ResponseCacheTest, EntryExpiresExactlyAtTtl) {
    cache_.put("/p", "ping", nullptr, "pong");

    advance(4999ms);
    EXPECT_TRUE(cache_.get("/p", "ping", nullptr).has_value());

    advance(1ms);
    EXPECT_FALSE(cache_.get("/p", "ping", nullptr).has_value());
    EXPECT_EQ(cache_.size(), 0u);
    EXPECT_EQ(cache_.stats().evictions, 1u);
}

TEST_F(ResponseCacheTest, PerEntryTtlOverridesDefault) {
    cache_.put("/p", "workspace/symbol", {{"query", "Foo"}}, json::array(), 100ms);

    advance(100ms);
    EXPECT_FALSE(cache_.get("/p", "workspace/symbol", {{"query", "Foo"}}).has_value());
}

TEST_F(ResponseCacheTest, KeyIncludesProjectMethodAndParams) {
    cache_.put("/p", "textDocument/hover", hover_params("file:///p/a.adb", 1), "a1");

    EXPECT_FALSE(cache_.get("/q", "textDocument/hover", hover_params("file:///p/a.adb", 1)).has_value());
    EXPECT_FALSE(cache_.get("/p", "textDocument/definition", hover_params("file:///p/a.adb", 1)).has_value());
    EXPECT_FALSE(cache_.get("/p", "textDocument/hover", hover_params("file:///p/a.adb", 2)).has_value());
    EXPECT_TRUE(cache_.get("/p", "textDocument/hover", hover_params("file:///p/a.adb", 1)).has_value());
}

TEST_F(ResponseCacheTest, ParamsKeyIgnoresMemberOrder) {
    json first = json::parse(R"({"query":"Foo","limit":5})");
    json second = json::parse(R"({"limit":5,"query":"Foo"})");

    EXPECT_EQ(ResponseCache::canonical_params(first), ResponseCache::canonical_params(second));

    cache_.put("/p", "workspace/symbol", first, "cached");
    EXPECT_TRUE(cache_.get("/p", "workspace/symbol", second).has_value());
}

TEST_F(ResponseCacheTest, PutReplacesExistingValue) {
    cache_.put("/p", "ping", nullptr, "old");
    cache_.put("/p", "ping", nullptr, "new");

    EXPECT_EQ(*cache_.get("/p", "ping", nullptr), "new");
    EXPECT_EQ(cache_.size(), 1u);
}

TEST_F(ResponseCacheTest, InvalidateTouchesOneProjectOnly) {
    cache_.put("/p", "a", nullptr, 1);
    cache_.put("/p", "b", nullptr, 2);
    cache_.put("/p2", "a", nullptr, 3);
    cache_.put("/q", "a", nullptr, 4);

    EXPECT_EQ(cache_.invalidate("/p"), 2u);

    EXPECT_FALSE(cache_.get("/p", "a", nullptr).has_value());
    EXPECT_TRUE(cache_.get("/p2", "a", nullptr).has_value());
    EXPECT_TRUE(cache_.get("/q", "a", nullptr).has_value());
}

TEST_F(ResponseCacheTest, InvalidateDocumentDropsOnlyItsEntries) {
    cache_.put("/p", "textDocument/hover", hover_params("file:///p/a.adb", 1), "a");
    cache_.put("/p", "textDocument/hover", hover_params("file:///p/b.adb", 1), "b");
    cache_.put("/p", "workspace/symbol", {{"query", "X"}}, "sym");

    EXPECT_EQ(cache_.invalidate_document("/p", "file:///p/a.adb"), 1u);

    EXPECT_FALSE(cache_.get("/p", "textDocument/hover", hover_params("file:///p/a.adb", 1)).has_value());
    EXPECT_TRUE(cache_.get("/p", "textDocument/hover", hover_params("file:///p/b.adb", 1)).has_value());
    EXPECT_TRUE(cache_.get("/p", "workspace/symbol", {{"query", "X"}}).has_value());
}

TEST_F(ResponseCacheTest, FullCacheDropsExpiredEntriesFirst) {
    cache_.put("/p", "short", nullptr, 1, 10ms);
    cache_.put("/p", "b", nullptr, 2);
    cache_.put("/p", "c", nullptr, 3);
    cache_.put("/p", "d", nullptr, 4);
    advance(20ms);

    cache_.put("/p", "e", nullptr, 5);

    EXPECT_EQ(cache_.size(), 4u);
    EXPECT_TRUE(cache_.get("/p", "b", nullptr).has_value());
    EXPECT_TRUE(cache_.get("/p", "e", nullptr).has_value());
}

TEST_F(ResponseCacheTest, FullCacheDropsSoonestToExpire) {
    cache_.put("/p", "a", nullptr, 1, 3000ms);
    cache_.put("/p", "b", nullptr, 2, 1000ms);
    cache_.put("/p", "c", nullptr, 3, 4000ms);
    cache_.put("/p", "d", nullptr, 4, 2000ms);

    cache_.put("/p", "e", nullptr, 5);

    EXPECT_EQ(cache_.size(), 4u);
    EXPECT_FALSE(cache_.get("/p", "b", nullptr).has_value());
    EXPECT_TRUE(cache_.get("/p", "a", nullptr).has_value());
    EXPECT_EQ(cache_.stats().evictions, 1u);
}

TEST_F(ResponseCacheTest, ClearAndResetStats) {
    cache_.put("/p", "a", nullptr, 1);
    cache_.get("/p", "a", nullptr);

    cache_.clear();
    EXPECT_EQ(cache_.size(), 0u);

    cache_.reset_stats();
    CacheStats stats = cache_.stats();
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.evictions, 0u);
    EXPECT_DOUBLE_EQ(stats.hit_rate(), 0.0);
}

TEST_F(ResponseCacheTest, StatsJson) {
    cache_.put("/p", "a", nullptr, 1);
    cache_.get("/p", "a", nullptr);
    cache_.get("/p", "missing", nullptr);

    json stats = cache_.stats_json();

    EXPECT_EQ(stats["size"], 1);
    EXPECT_EQ(stats["hits"], 1);
    EXPECT_EQ(stats["misses"], 1);
    EXPECT_DOUBLE_EQ(stats["hit_rate"].get<double>(), 50.0);
}

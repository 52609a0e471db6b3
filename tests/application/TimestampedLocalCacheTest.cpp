#include <gtest/gtest.h>

#include "application/TimestampedLocalCache.hpp"
#include "mocks/InMemoryLocalCache.hpp"
#include <thread>

using namespace tiercache::application;
using namespace tiercache::tests::mocks;
using namespace std::chrono;

class TimestampedLocalCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        inner_ = std::make_shared<InMemoryLocalCache>();
        now_ = TtlCodec::Clock::now();
        cache_ = std::make_shared<TimestampedLocalCache>(
            inner_, milliseconds(50), [this] { return now_; });
    }

    void advance(milliseconds d) { now_ += d; }

    std::shared_ptr<InMemoryLocalCache> inner_;
    TtlCodec::TimePoint now_;
    std::shared_ptr<TimestampedLocalCache> cache_;
};

TEST_F(TimestampedLocalCacheTest, Set_AppendsFourByteTimestamp) {
    cache_->set("k", "payload");

    auto raw = inner_->raw("k");
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->size(), std::string("payload").size() + TtlCodec::kTimestampSize);
    EXPECT_EQ(raw->substr(0, 7), "payload");
}

TEST_F(TimestampedLocalCacheTest, Get_WithinWindow_ReturnsStrippedPayload) {
    cache_->set("k", "payload");
    advance(milliseconds(20));

    auto value = cache_->get("k");

    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "payload");
}

TEST_F(TimestampedLocalCacheTest, Get_AtExactWindow_StillFresh) {
    cache_->set("k", "payload");
    advance(milliseconds(50));

    EXPECT_TRUE(cache_->get("k").has_value());
}

TEST_F(TimestampedLocalCacheTest, Get_AfterWindow_ReportsMissWithoutRemoving) {
    cache_->set("k", "payload");
    advance(milliseconds(100));

    EXPECT_FALSE(cache_->get("k").has_value());
    EXPECT_FALSE(cache_->has("k"));
    // Физически запись остаётся до перезаписи или вытеснения
    EXPECT_TRUE(inner_->has("k"));
}

TEST_F(TimestampedLocalCacheTest, Set_Again_RefreshesTimestamp) {
    cache_->set("k", "v1");
    advance(milliseconds(40));
    cache_->set("k", "v2");
    advance(milliseconds(40));

    auto value = cache_->get("k");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "v2");
}

TEST_F(TimestampedLocalCacheTest, Get_Missing_ReturnsNullopt) {
    EXPECT_FALSE(cache_->get("missing").has_value());
}

TEST_F(TimestampedLocalCacheTest, Get_EmptyStoredPayload_ReturnedAsIs) {
    inner_->set("empty", "");

    auto value = cache_->get("empty");

    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(value->empty());
}

TEST_F(TimestampedLocalCacheTest, Get_PayloadShorterThanTimestamp_IsLogicError) {
    inner_->set("short", "abcd");

    EXPECT_THROW(cache_->get("short"), std::logic_error);
}

TEST_F(TimestampedLocalCacheTest, Remove_DeletesFromInner) {
    cache_->set("k", "payload");
    cache_->remove("k");

    EXPECT_FALSE(inner_->has("k"));
}

TEST_F(TimestampedLocalCacheTest, Constructor_NonPositiveWindow_Throws) {
    EXPECT_THROW(TimestampedLocalCache(inner_, milliseconds(0)), std::invalid_argument);
    EXPECT_THROW(TimestampedLocalCache(nullptr, milliseconds(10)), std::invalid_argument);
}

TEST(TimestampedLocalCacheRealClockTest, ExpiresAfterSleep) {
    auto inner = std::make_shared<InMemoryLocalCache>();
    TimestampedLocalCache cache(inner, milliseconds(50));

    cache.set("k", "payload");
    EXPECT_TRUE(cache.get("k").has_value());

    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_FALSE(cache.get("k").has_value());
}

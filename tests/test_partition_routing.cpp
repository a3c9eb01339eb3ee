/// @file test_partition_routing.cpp
/// Unit tests for partition_routing.hpp: target range resolution and
/// continuation stitching.

#include "continuation.hpp"
#include "fakes.hpp"
#include "http_constants.hpp"
#include "partition_routing.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace partition_query;
using namespace partition_query::testing_support;

namespace {

class PartitionRoutingTest : public ::testing::Test {
protected:
    void SetUp() override {
        source = std::make_shared<FakeMetadataSource>();
        source->setRanges("rid", {pkRange("0", "", "40"), pkRange("1", "40", "80"),
                                  pkRange("2", "80", "FF")});
        cache = std::make_unique<PartitionKeyRangeCache>(source);
    }

    std::vector<CompositeContinuationToken> stitched(const std::map<std::string, std::string>& h) {
        auto it = h.find(headers::kContinuation);
        return it == h.end() ? std::vector<CompositeContinuationToken>{}
                             : parseContinuation(it->second);
    }

    std::shared_ptr<FakeMetadataSource>     source;
    std::unique_ptr<PartitionKeyRangeCache> cache;
    const std::vector<KeyRange>             everything{KeyRange::fullRange()};
};

} // namespace

// ============================================================================
// extractContinuation
// ============================================================================

TEST(ExtractContinuation, NoHeaderYieldsNoTokens) {
    std::map<std::string, std::string> h;
    EXPECT_TRUE(extractContinuation(h).empty());
    EXPECT_EQ(h.count(headers::kContinuation), 0u);
}

TEST(ExtractContinuation, ReplacesCompositeWithBackendToken) {
    std::map<std::string, std::string> h;
    h[headers::kContinuation] = serializeContinuation({{"1", "40", "80", "backend-7"}});

    auto tokens = extractContinuation(h);
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].rangeId, "1");
    EXPECT_EQ(h[headers::kContinuation], "backend-7");
}

TEST(ExtractContinuation, EmptyBackendTokenRemovesHeader) {
    std::map<std::string, std::string> h;
    h[headers::kContinuation] = serializeContinuation({{"1", "40", "80", ""}});

    auto tokens = extractContinuation(h);
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(h.count(headers::kContinuation), 0u);
}

TEST(ExtractContinuation, MalformedThrows) {
    std::map<std::string, std::string> h;
    h[headers::kContinuation] = "{oops";
    EXPECT_THROW(extractContinuation(h), std::invalid_argument);
}

// ============================================================================
// tryGetTargetRange
// ============================================================================

TEST_F(PartitionRoutingTest, FreshQueryTargetsFirstOverlappingRange) {
    auto info = tryGetTargetRange(everything, *cache, "rid", {});
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->resolvedRange.id, "0");
    EXPECT_TRUE(info->continuationTokens.empty());
}

TEST_F(PartitionRoutingTest, FreshPointQueryTargetsOwningRange) {
    auto info = tryGetTargetRange({KeyRange::point("55")}, *cache, "rid", {});
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->resolvedRange.id, "1");
}

TEST_F(PartitionRoutingTest, NoProvidedRangesTargetsFirstRange) {
    auto info = tryGetTargetRange({}, *cache, "rid", {});
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->resolvedRange.id, "0");
    EXPECT_TRUE(info->continuationTokens.empty());
}

TEST_F(PartitionRoutingTest, UnknownCollectionIsUnresolvable) {
    EXPECT_FALSE(tryGetTargetRange(everything, *cache, "other", {}).has_value());
}

TEST_F(PartitionRoutingTest, LiveTokenRangeIsKept) {
    std::vector<CompositeContinuationToken> tokens = {{"1", "40", "80", "t"}};
    auto info = tryGetTargetRange(everything, *cache, "rid", tokens);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->resolvedRange.id, "1");
    EXPECT_EQ(info->continuationTokens, tokens);
    EXPECT_EQ(cache->sourceReads(), 1);
}

TEST_F(PartitionRoutingTest, SplitRemapsTokenToChildrenAscending) {
    source->split("rid", "1", "4", "3", "60");   // ids deliberately not in key order

    std::vector<CompositeContinuationToken> tokens = {
        {"1", "40", "80", "parent-token"},
        {"2", "80", "FF", ""},
    };
    auto info = tryGetTargetRange(everything, *cache, "rid", tokens);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->resolvedRange.id, "4");

    ASSERT_EQ(info->continuationTokens.size(), 3u);
    EXPECT_EQ(info->continuationTokens[0], (CompositeContinuationToken{"4", "40", "60", "parent-token"}));
    EXPECT_EQ(info->continuationTokens[1], (CompositeContinuationToken{"3", "60", "80", "parent-token"}));
    EXPECT_EQ(info->continuationTokens[2], (CompositeContinuationToken{"2", "80", "FF", ""}));
}

TEST_F(PartitionRoutingTest, SplitRemapClipsChildrenToTokenBounds) {
    source->split("rid", "1", "4", "5", "60");

    // The token itself only covered part of the old parent.
    std::vector<CompositeContinuationToken> tokens = {{"1", "50", "70", "t"}};
    auto info = tryGetTargetRange(everything, *cache, "rid", tokens);
    ASSERT_TRUE(info.has_value());
    ASSERT_EQ(info->continuationTokens.size(), 2u);
    EXPECT_EQ(info->continuationTokens[0], (CompositeContinuationToken{"4", "50", "60", "t"}));
    EXPECT_EQ(info->continuationTokens[1], (CompositeContinuationToken{"5", "60", "70", "t"}));
}

TEST_F(PartitionRoutingTest, StaleCacheIsRefreshedBeforeRemapping) {
    // Token was issued by a newer map than the one cached here.
    cache->tryLookup("rid", false);
    source->split("rid", "1", "4", "5", "60");

    std::vector<CompositeContinuationToken> tokens = {{"5", "60", "80", "t"}};
    auto info = tryGetTargetRange(everything, *cache, "rid", tokens);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->resolvedRange.id, "5");
    EXPECT_EQ(info->continuationTokens, tokens);
    EXPECT_EQ(cache->sourceReads(), 2);
}

TEST_F(PartitionRoutingTest, MergeResolvesToCoveringRange) {
    source->setRanges("rid", {pkRange("0", "", "40"), pkRange("9", "40", "FF", {"1", "2"})});

    std::vector<CompositeContinuationToken> tokens = {{"1", "40", "80", "t"}};
    auto info = tryGetTargetRange(everything, *cache, "rid", tokens);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->resolvedRange.id, "9");
    ASSERT_EQ(info->continuationTokens.size(), 1u);
    EXPECT_EQ(info->continuationTokens[0], (CompositeContinuationToken{"9", "40", "80", "t"}));
}

TEST_F(PartitionRoutingTest, InconsistentMapAfterRefreshIsUnresolvable) {
    cache->tryLookup("rid", false);
    source->setRanges("rid", {pkRange("0", "", "40"), pkRange("2", "80", "FF")});

    std::vector<CompositeContinuationToken> tokens = {{"7", "40", "80", "t"}};
    EXPECT_FALSE(tryGetTargetRange(everything, *cache, "rid", tokens).has_value());
}

// ============================================================================
// tryAddRangeToContinuation
// ============================================================================

TEST_F(PartitionRoutingTest, BackendContinuationStaysOnRange) {
    ResolvedRangeInfo info{pkRange("0", "", "40"), {}};
    std::map<std::string, std::string> h{{headers::kContinuation, "b1"}};

    ASSERT_TRUE(tryAddRangeToContinuation(h, everything, *cache, "rid", info));
    auto tokens = stitched(h);
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0], (CompositeContinuationToken{"0", "", "40", "b1"}));
}

TEST_F(PartitionRoutingTest, DrainedRangeAdvancesToNext) {
    ResolvedRangeInfo info{pkRange("0", "", "40"), {}};
    std::map<std::string, std::string> h;

    ASSERT_TRUE(tryAddRangeToContinuation(h, everything, *cache, "rid", info));
    auto tokens = stitched(h);
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0], (CompositeContinuationToken{"1", "40", "80", ""}));
}

TEST_F(PartitionRoutingTest, LastRangeDrainedRemovesHeader) {
    ResolvedRangeInfo info{pkRange("2", "80", "FF"), {{"2", "80", "FF", "x"}}};
    std::map<std::string, std::string> h{{headers::kContinuation, ""}};

    ASSERT_TRUE(tryAddRangeToContinuation(h, everything, *cache, "rid", info));
    EXPECT_EQ(h.count(headers::kContinuation), 0u);
}

TEST_F(PartitionRoutingTest, AdvanceSkipsRangesOutsideProvidedIntervals) {
    std::vector<KeyRange> provided = {
        KeyRange{"10", "20", true, false},
        KeyRange{"90", "A0", true, false},
    };
    ResolvedRangeInfo info{pkRange("0", "", "40"), {}};
    std::map<std::string, std::string> h;

    ASSERT_TRUE(tryAddRangeToContinuation(h, provided, *cache, "rid", info));
    auto tokens = stitched(h);
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0], (CompositeContinuationToken{"2", "90", "FF", ""}));
}

TEST_F(PartitionRoutingTest, PointQueryFinishesAfterOwningRange) {
    std::vector<KeyRange> provided = {KeyRange::point("55")};
    ResolvedRangeInfo info{pkRange("1", "40", "80"), {}};
    std::map<std::string, std::string> h;

    ASSERT_TRUE(tryAddRangeToContinuation(h, provided, *cache, "rid", info));
    EXPECT_EQ(h.count(headers::kContinuation), 0u);
}

TEST_F(PartitionRoutingTest, PendingChildTokensAreWalkedInOrder) {
    std::vector<CompositeContinuationToken> pending = {
        {"4", "40", "60", "t"},
        {"5", "60", "80", "t"},
    };
    ResolvedRangeInfo info{pkRange("4", "40", "60"), pending};

    std::map<std::string, std::string> more{{headers::kContinuation, "t2"}};
    ASSERT_TRUE(tryAddRangeToContinuation(more, everything, *cache, "rid", info));
    auto stay = stitched(more);
    ASSERT_EQ(stay.size(), 2u);
    EXPECT_EQ(stay[0], (CompositeContinuationToken{"4", "40", "60", "t2"}));
    EXPECT_EQ(stay[1], pending[1]);

    std::map<std::string, std::string> drained;
    ASSERT_TRUE(tryAddRangeToContinuation(drained, everything, *cache, "rid", info));
    auto next = stitched(drained);
    ASSERT_EQ(next.size(), 1u);
    EXPECT_EQ(next[0], pending[1]);
}

TEST_F(PartitionRoutingTest, LastChildDrainedAdvancesPastParentBounds) {
    ResolvedRangeInfo info{pkRange("5", "60", "80"), {{"5", "60", "80", "t"}}};
    std::map<std::string, std::string> h;

    ASSERT_TRUE(tryAddRangeToContinuation(h, everything, *cache, "rid", info));
    auto tokens = stitched(h);
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0], (CompositeContinuationToken{"2", "80", "FF", ""}));
}

TEST_F(PartitionRoutingTest, AdvanceFailsWhenMapUnavailable) {
    ResolvedRangeInfo info{pkRange("0", "", "40"), {}};
    std::map<std::string, std::string> h;
    EXPECT_FALSE(tryAddRangeToContinuation(h, everything, *cache, "unknown", info));
}

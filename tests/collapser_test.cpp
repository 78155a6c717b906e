#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <future>
#include <optional>
#include <stdexcept>
#include <vector>

#include "collapse/collapser.hpp"
#include "collapse/errors.hpp"
#include "ranges/range_plan.hpp"

using prc::decimal;
using prc::price_range_bucket;

namespace {

std::optional<decimal> d(std::int64_t whole) { return decimal::from_integer(whole); }

price_range_bucket bucket(std::optional<decimal> from, std::optional<decimal> to, std::uint64_t count) {
    return price_range_bucket{from, to, count};
}

// Ten-wide contiguous buckets with the given counts; outer ends open.
std::vector<price_range_bucket> ten_wide(const std::vector<std::uint64_t>& counts) {
    std::vector<price_range_bucket> out;
    for (std::size_t i = 0; i < counts.size(); ++i) {
        price_range_bucket b;
        if (i > 0) b.from = d(static_cast<std::int64_t>(10 * i));
        if (i + 1 < counts.size()) b.to = d(static_cast<std::int64_t>(10 * (i + 1)));
        b.doc_count = counts[i];
        out.push_back(b);
    }
    return out;
}

// The nine Luggage prices counted into the fine-grained plan.
std::vector<price_range_bucket> luggage_fine_buckets() {
    std::vector<decimal> prices;
    for (const char* p : {"78.60", "205.60", "134.44", "21.52", "55.81", "32.29", "39.98", "32.99", "418.60"})
        prices.push_back(decimal::parse(p));
    return prc::aggregate(prices, prc::fine_grained_plan());
}

std::uint64_t total(const std::vector<price_range_bucket>& v) {
    std::uint64_t n = 0;
    for (const auto& b : v) n += b.doc_count;
    return n;
}

void expect_well_formed(const std::vector<price_range_bucket>& out) {
    ASSERT_FALSE(out.empty());
    EXPECT_FALSE(out.front().from.has_value());
    EXPECT_FALSE(out.back().to.has_value());
    for (std::size_t i = 1; i < out.size(); ++i) {
        ASSERT_TRUE(out[i].from.has_value());
        ASSERT_TRUE(out[i - 1].to.has_value());
        EXPECT_EQ(*out[i].from, *out[i - 1].to);
        EXPECT_LT(*out[i - 1].to, out[i].to.value_or(decimal::from_integer(1000000)));
    }
}

}

TEST(CollapserTest, LuggageFortyBucketsIntoThree) {
    const auto input = luggage_fine_buckets();
    ASSERT_EQ(input.size(), 40u);

    const auto out = prc::collapse(input, 3);

    const std::vector<price_range_bucket> expected = {
        bucket(std::nullopt, d(80), 6),
        bucket(d(80), d(250), 2),
        bucket(d(250), std::nullopt, 1),
    };
    EXPECT_EQ(out, expected);
}

TEST(CollapserTest, ConservesDocumentsAndRespectsTarget) {
    const auto input = luggage_fine_buckets();
    for (int target = 1; target <= 10; ++target) {
        SCOPED_TRACE(target);
        const auto out = prc::collapse(input, target);
        EXPECT_EQ(out.size(), std::min<std::size_t>(static_cast<std::size_t>(target), 7));
        EXPECT_EQ(total(out), 9u);
        expect_well_formed(out);
    }
}

TEST(CollapserTest, DoesNotModifyInput) {
    const auto input = luggage_fine_buckets();
    const auto copy = input;
    (void)prc::collapse(input, 2);
    EXPECT_EQ(input, copy);
}

TEST(CollapserTest, TieMergesRightPair) {
    // A+B == B+C: C merges into B
    const auto out = prc::collapse(ten_wide({1, 1, 1}), 2);
    const std::vector<price_range_bucket> expected = {
        bucket(std::nullopt, d(10), 1),
        bucket(d(10), std::nullopt, 2),
    };
    EXPECT_EQ(out, expected);
}

TEST(CollapserTest, StrictlyLighterLeftPairMerges) {
    const auto out = prc::collapse(ten_wide({1, 1, 2}), 2);
    const std::vector<price_range_bucket> expected = {
        bucket(std::nullopt, d(20), 2),
        bucket(d(20), std::nullopt, 2),
    };
    EXPECT_EQ(out, expected);
}

TEST(CollapserTest, DeterministicAcrossCalls) {
    const auto input = ten_wide({5, 1, 1, 7, 2, 2, 9, 1, 3, 3, 4});
    const auto first = prc::collapse(input, 4);
    for (int i = 0; i < 5; ++i) EXPECT_EQ(prc::collapse(input, 4), first);
}

TEST(CollapserTest, AlreadySmallEnoughOnlyOpensTheEnds) {
    const std::vector<price_range_bucket> input = {
        bucket(d(10), d(20), 5),
        bucket(d(20), d(30), 5),
    };
    const auto out = prc::collapse(input, 3);
    const std::vector<price_range_bucket> expected = {
        bucket(std::nullopt, d(20), 5),
        bucket(d(20), std::nullopt, 5),
    };
    EXPECT_EQ(out, expected);
}

TEST(CollapserTest, DropsEmptyBucketsAndCoversTheGap) {
    const std::vector<price_range_bucket> input = {
        bucket(d(0), d(10), 1),
        bucket(d(10), d(20), 0),
        bucket(d(20), d(30), 1),
    };
    const auto out = prc::collapse(input, 5);
    const std::vector<price_range_bucket> expected = {
        bucket(std::nullopt, d(10), 1),
        bucket(d(10), std::nullopt, 1),
    };
    EXPECT_EQ(out, expected);
}

TEST(CollapserTest, SingleNonEmptyBucketCoversEverything) {
    const auto out = prc::collapse(ten_wide({0, 0, 4, 0}), 3);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], bucket(std::nullopt, std::nullopt, 4));
}

TEST(CollapserTest, TwoBucketsIntoOne) {
    const auto out = prc::collapse(ten_wide({3, 4}), 1);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], bucket(std::nullopt, std::nullopt, 7));
}

TEST(CollapserTest, TargetOneFromMany) {
    const auto out = prc::collapse(ten_wide({1, 2, 3, 4, 5, 6, 7, 8}), 1);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].doc_count, 36u);
}

TEST(CollapserTest, AllZeroCountsIsEmptyDistribution) {
    EXPECT_THROW(prc::collapse(ten_wide({0, 0, 0}), 2), prc::empty_distribution);
    EXPECT_THROW(prc::collapse({}, 2), prc::empty_distribution);
}

TEST(CollapserTest, TargetBelowOneIsRejected) {
    EXPECT_THROW(prc::collapse(ten_wide({1, 2, 3}), 0), std::invalid_argument);
    EXPECT_THROW(prc::collapse(ten_wide({1, 2, 3}), -4), std::invalid_argument);
}

TEST(CollapserTest, NonContiguousInputIsRejected) {
    const std::vector<price_range_bucket> gap = {
        bucket(d(0), d(10), 1),
        bucket(d(20), d(30), 1),
    };
    EXPECT_THROW(prc::collapse(gap, 1), prc::non_contiguous_buckets);

    const std::vector<price_range_bucket> inverted = {bucket(d(30), d(20), 1)};
    EXPECT_THROW(prc::collapse(inverted, 1), prc::non_contiguous_buckets);

    // an open end in the middle would overlap its neighbours
    const std::vector<price_range_bucket> open_inside = {
        bucket(std::nullopt, d(10), 1),
        bucket(d(10), std::nullopt, 1),
        bucket(d(20), d(30), 1),
        bucket(d(30), std::nullopt, 1),
    };
    EXPECT_THROW(prc::collapse(open_inside, 4), prc::non_contiguous_buckets);

    const std::vector<price_range_bucket> open_below_inside = {
        bucket(d(0), d(10), 1),
        bucket(std::nullopt, d(20), 1),
    };
    EXPECT_THROW(prc::collapse(open_below_inside, 2), prc::non_contiguous_buckets);

    // still an invalid_argument for callers that only know the base type
    EXPECT_THROW(prc::collapse(gap, 1), std::invalid_argument);
}

TEST(CollapserTest, ConcurrentCallsAgree) {
    const auto input = luggage_fine_buckets();
    const auto expected = prc::collapse(input, 3);

    std::vector<std::future<std::vector<price_range_bucket>>> runs;
    for (int i = 0; i < 8; ++i)
        runs.push_back(std::async(std::launch::async, [&input] { return prc::collapse(input, 3); }));
    for (auto& r : runs) EXPECT_EQ(r.get(), expected);
}

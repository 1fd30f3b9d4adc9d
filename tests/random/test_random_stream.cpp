/// @file tests/random/test_random_stream.cpp
/// @brief RandomStream reproducibility and range tests.

#include "ecutune/random_stream.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

using namespace ecutune;

namespace {

std::vector<double> draw_n(std::int64_t seed, std::size_t n) {
    RandomStream rng(seed);
    std::vector<double> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(rng.next_unit());
    }
    return out;
}

} // anonymous namespace

// ─── Reproducibility ──────────────────────────────────────────────────────────

TEST(RandomStream_Seed, SameSeed_SameSequence) {
    EXPECT_EQ(draw_n(777, 256), draw_n(777, 256));
}

TEST(RandomStream_Seed, DifferentSeeds_DifferentSequences) {
    EXPECT_NE(draw_n(1, 16), draw_n(2, 16));
}

TEST(RandomStream_Seed, NegativeSeed_IsAccepted) {
    EXPECT_EQ(draw_n(-42, 32), draw_n(-42, 32));
    EXPECT_NE(draw_n(-42, 32), draw_n(42, 32));
}

TEST(RandomStream_Seed, SeedAccessor_ReturnsConstructorSeed) {
    const RandomStream rng(-9);
    EXPECT_EQ(rng.seed(), -9);
}

TEST(RandomStream_Seed, FirstDraw_MatchesMt19937_64Reference) {
    // First output of mt19937_64 for its default seed 5489.
    RandomStream rng(5489);
    const double expected = static_cast<double>(14514284786278117030ULL >> 11)
                          / 9007199254740992.0;
    EXPECT_DOUBLE_EQ(rng.next_unit(), expected);
}

// ─── Range ────────────────────────────────────────────────────────────────────

TEST(RandomStream_Unit, AlwaysInHalfOpenUnitInterval) {
    RandomStream rng(123);
    for (int i = 0; i < 10000; ++i) {
        const double u = rng.next_unit();
        ASSERT_GE(u, 0.0);
        ASSERT_LT(u, 1.0);
    }
}

TEST(RandomStream_Uniform, StaysWithinBounds) {
    RandomStream rng(99);
    for (int i = 0; i < 5000; ++i) {
        const double v = rng.uniform(-2.0, 8.0);
        ASSERT_GE(v, -2.0);
        ASSERT_LT(v, 8.0);
    }
}

TEST(RandomStream_Uniform, DegenerateRange_ReturnsLo) {
    RandomStream rng(5);
    EXPECT_EQ(rng.uniform(3.25, 3.25), 3.25);
    EXPECT_EQ(rng.draws(), 1u) << "a degenerate range still consumes a draw";
}

TEST(RandomStream_Uniform, InvertedRange_LiesBetweenBounds) {
    RandomStream rng(11);
    for (int i = 0; i < 1000; ++i) {
        const double v = rng.uniform(5.0, 1.0);
        ASSERT_GT(v, 1.0);
        ASSERT_LE(v, 5.0);
    }
}

TEST(RandomStream_Draws, CountsEveryDraw) {
    RandomStream rng(0);
    EXPECT_EQ(rng.draws(), 0u);
    (void)rng.next_unit();
    (void)rng.uniform(0.0, 1.0);
    (void)rng.uniform(10.0, 20.0);
    EXPECT_EQ(rng.draws(), 3u);
}

/// @file tests/search/test_candidate_generator.cpp
/// @brief CandidateGenerator bound and smoothness tests.

#include "ecutune/candidate.hpp"
#include "ecutune/validator.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace ecutune;
using namespace ecutune::search;

namespace {

BaselineCurve scenario_curve() {
    return *BaselineCurve::make({1000, 2000, 3000, 4000, 5000},
                                {200.0, 210.0, 220.0, 215.0, 200.0});
}

BaselineCurve flat_curve(std::size_t n, double torque) {
    std::vector<int>    rpm;
    std::vector<double> tq;
    for (std::size_t i = 0; i < n; ++i) {
        rpm.push_back(1000 + static_cast<int>(i) * 500);
        tq.push_back(torque);
    }
    return *BaselineCurve::make(std::move(rpm), tq);
}

} // anonymous namespace

// ─── Per-bin ceilings ─────────────────────────────────────────────────────────

TEST(CandidateGenerator_Limits, PerBinCeilingIsMinOfAbsAndRatio) {
    const auto curve = scenario_curve();
    const Constraints c;  // 8 Nm, 3%
    const CandidateGenerator gen(curve, c);

    EXPECT_DOUBLE_EQ(gen.per_bin_limit()(0), 6.0);
    EXPECT_DOUBLE_EQ(gen.per_bin_limit()(2), 6.6);
    EXPECT_DOUBLE_EQ(gen.global_limit(), 6.0);
}

TEST(CandidateGenerator_Limits, AbsoluteCapBinds) {
    const auto curve = flat_curve(4, 500.0);  // 3% of 500 = 15 > 8
    const Constraints c;
    const CandidateGenerator gen(curve, c);
    EXPECT_DOUBLE_EQ(gen.global_limit(), 8.0);
}

TEST(CandidateGenerator_MinSigma, MatchesCurvatureBound) {
    EXPECT_DOUBLE_EQ(CandidateGenerator::min_sigma(6.0, 0.15), std::sqrt(40.0));
    EXPECT_TRUE(std::isinf(CandidateGenerator::min_sigma(6.0, 0.0)));
}

// ─── generate ─────────────────────────────────────────────────────────────────

TEST(CandidateGenerator_Generate, WithinCeilingsAndSmooth) {
    const auto curve = scenario_curve();
    const Constraints c;
    const CandidateGenerator gen(curve, c);
    RandomStream rng(777);

    for (int k = 0; k < 500; ++k) {
        const auto d = gen.generate(rng, 1.0);
        ASSERT_EQ(d.size(), 5);
        for (Eigen::Index i = 0; i < d.size(); ++i) {
            ASSERT_TRUE(std::isfinite(d(i)));
            ASSERT_GE(d(i), 0.0);
            ASSERT_LE(d(i), gen.per_bin_limit()(i));
        }
        const auto d2 = validation::second_differences(d);
        for (Eigen::Index i = 0; i < d2.size(); ++i) {
            ASSERT_LE(d2(i), c.smoothness.max_second_derivative + 1e-12);
        }
    }
}

TEST(CandidateGenerator_Generate, ScaleShrinksPeak) {
    const auto curve = flat_curve(11, 200.0);
    const Constraints c;
    const CandidateGenerator gen(curve, c);
    RandomStream rng(3);

    for (int k = 0; k < 200; ++k) {
        const auto d = gen.generate(rng, 0.5);
        ASSERT_LE(d.maxCoeff(), 0.5 * gen.global_limit() + 1e-12);
    }
}

TEST(CandidateGenerator_Generate, DrawsPeakSigmaCenter) {
    const auto curve = scenario_curve();
    const Constraints c;
    const CandidateGenerator gen(curve, c);
    RandomStream rng(1);
    (void)gen.generate(rng, 1.0);
    EXPECT_EQ(rng.draws(), 3u);
}

TEST(CandidateGenerator_Generate, ZeroSmoothnessLimit_ZeroProfileWithoutDraws) {
    const auto curve = scenario_curve();
    Constraints c;
    c.smoothness.max_second_derivative = 0.0;
    const CandidateGenerator gen(curve, c);
    RandomStream rng(1);

    const auto d = gen.generate(rng, 1.0);
    EXPECT_TRUE(d.isZero());
    EXPECT_EQ(rng.draws(), 0u);
}

TEST(CandidateGenerator_Generate, ZeroBinCap_ZeroProfile) {
    const auto curve = scenario_curve();
    Constraints c;
    c.max_bin_delta_nm = 0.0;
    const CandidateGenerator gen(curve, c);
    RandomStream rng(1);
    EXPECT_TRUE(gen.generate(rng, 1.0).isZero());
}

TEST(CandidateGenerator_Generate, SingleBinCurve) {
    const auto curve = *BaselineCurve::make({3000}, {250.0});
    const Constraints c;
    const CandidateGenerator gen(curve, c);
    RandomStream rng(42);

    const auto d = gen.generate(rng, 1.0);
    ASSERT_EQ(d.size(), 1);
    EXPECT_GE(d(0), 0.0);
    EXPECT_LE(d(0), 7.5);
}

TEST(CandidateGenerator_Generate, SameSeed_SameProfile) {
    const auto curve = flat_curve(11, 200.0);
    const Constraints c;
    const CandidateGenerator gen(curve, c);
    RandomStream a(2024);
    RandomStream b(2024);
    for (int k = 0; k < 20; ++k) {
        ASSERT_EQ(gen.generate(a, 1.0), gen.generate(b, 1.0));
    }
}

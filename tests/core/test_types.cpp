/// @file tests/core/test_types.cpp
/// @brief BaselineCurve construction and calibration helper tests.

#include "ecutune/types.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

using namespace ecutune;

// ─── BaselineCurve::make ──────────────────────────────────────────────────────

TEST(BaselineCurve_Make, ValidCurve_Constructs) {
    auto curve = BaselineCurve::make({1000, 2000, 3000}, {200.0, 210.0, 205.0});
    ASSERT_TRUE(curve.has_value());
    EXPECT_EQ(curve->size(), 3u);
    EXPECT_DOUBLE_EQ(curve->peak(), 210.0);
    EXPECT_EQ(curve->rpm_bins, (std::vector<int>{1000, 2000, 3000}));
}

TEST(BaselineCurve_Make, SingleBin_Constructs) {
    auto curve = BaselineCurve::make({3000}, {250.0});
    ASSERT_TRUE(curve.has_value());
    EXPECT_EQ(curve->size(), 1u);
}

TEST(BaselineCurve_Make, Empty_Nullopt) {
    EXPECT_FALSE(BaselineCurve::make({}, {}).has_value());
}

TEST(BaselineCurve_Make, LengthMismatch_Nullopt) {
    EXPECT_FALSE(BaselineCurve::make({1000, 2000}, {200.0}).has_value());
}

TEST(BaselineCurve_Make, DuplicateRpm_Nullopt) {
    EXPECT_FALSE(BaselineCurve::make({1000, 1000}, {200.0, 201.0}).has_value());
}

TEST(BaselineCurve_Make, DescendingRpm_Nullopt) {
    EXPECT_FALSE(BaselineCurve::make({2000, 1000}, {200.0, 201.0}).has_value());
}

TEST(BaselineCurve_Make, NonPositiveTorque_Nullopt) {
    EXPECT_FALSE(BaselineCurve::make({1000, 2000}, {200.0, 0.0}).has_value());
    EXPECT_FALSE(BaselineCurve::make({1000, 2000}, {-1.0, 200.0}).has_value());
}

TEST(BaselineCurve_Make, NonFiniteTorque_Nullopt) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(BaselineCurve::make({1000, 2000}, {200.0, nan}).has_value());
    EXPECT_FALSE(BaselineCurve::make({1000, 2000}, {inf, 200.0}).has_value());
}

// ─── Calibration names ────────────────────────────────────────────────────────

TEST(CalibrationParam_Names, WireNames) {
    EXPECT_EQ(to_string(CalibrationParam::AfrTarget),      "afr_target");
    EXPECT_EQ(to_string(CalibrationParam::IgnTimingDeg),   "ign_timing_deg");
    EXPECT_EQ(to_string(CalibrationParam::BoostTargetPsi), "boost_target_psi");
}

TEST(CalibrationParam_Names, ParseRoundTripsEveryParam) {
    for (const auto p : ALL_CALIBRATION_PARAMS) {
        const auto parsed = parse_calibration_param(to_string(p));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, p);
    }
}

TEST(CalibrationParam_Names, UnknownName_Nullopt) {
    EXPECT_FALSE(parse_calibration_param("lambda").has_value());
    EXPECT_FALSE(parse_calibration_param("").has_value());
}

// ─── Ranges ───────────────────────────────────────────────────────────────────

TEST(CalibrationRange_Contains, InclusiveBounds) {
    const CalibrationRange r{11.5, 14.7};
    EXPECT_TRUE(r.contains(11.5));
    EXPECT_TRUE(r.contains(14.7));
    EXPECT_TRUE(r.contains(13.0));
    EXPECT_FALSE(r.contains(10.0));
    EXPECT_FALSE(r.contains(std::numeric_limits<double>::quiet_NaN()));
}

TEST(Constraints_RangeFor, ConfiguredAndMissing) {
    Constraints c;
    c.calibration_ranges[CalibrationParam::AfrTarget] = {11.5, 14.7};
    ASSERT_TRUE(c.range_for(CalibrationParam::AfrTarget).has_value());
    EXPECT_DOUBLE_EQ(c.range_for(CalibrationParam::AfrTarget)->hi, 14.7);
    EXPECT_FALSE(c.range_for(CalibrationParam::BoostTargetPsi).has_value());
}

TEST(Constraints_Defaults, MatchDocumentedValues) {
    const Constraints c;
    EXPECT_DOUBLE_EQ(c.max_peak_gain_ratio, 0.02);
    EXPECT_DOUBLE_EQ(c.max_bin_delta_nm, 8.0);
    EXPECT_DOUBLE_EQ(c.max_bin_delta_ratio, 0.03);
    EXPECT_DOUBLE_EQ(c.smoothness.max_second_derivative, 0.15);
    EXPECT_TRUE(c.calibration_ranges.empty());
}

TEST(DefaultRange, EveryParamHasOrderedRange) {
    for (const auto p : ALL_CALIBRATION_PARAMS) {
        const auto r = default_range(p);
        EXPECT_LE(r.lo, r.hi) << to_string(p);
    }
}

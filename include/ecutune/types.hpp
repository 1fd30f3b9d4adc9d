#pragma once

/// @file include/ecutune/types.hpp
/// @brief Shared value types for the ecutune torque-curve optimizer.
///
/// All modules include this file. It defines the baseline curve, the
/// constraint record, the calibration record and the Eigen-based vector
/// aliases used for every per-bin torque quantity.

#include "ecutune/constants.hpp"

#include <Eigen/Dense>

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace ecutune {

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Per-bin torque values in Nm, one entry per RPM bin.
using TorqueVector = Eigen::VectorXd;

/// Additive per-bin torque change proposed by the optimizer.
using DeltaProfile = Eigen::VectorXd;

// ─── Baseline Curve ───────────────────────────────────────────────────────────

/// A baseline torque curve: rpm strictly ascending, torque finite and > 0.
///
/// Construct through `make()` to have the invariants checked. Direct
/// aggregate construction is allowed for tests that deliberately feed the
/// validator malformed input.
struct BaselineCurve {
    std::vector<int> rpm_bins;   ///< Engine speed of each bin
    TorqueVector     torque_nm;  ///< Baseline torque of each bin

    /// Number of bins (length of the torque vector).
    [[nodiscard]] std::size_t size() const noexcept {
        return static_cast<std::size_t>(torque_nm.size());
    }

    /// Largest baseline torque value. Undefined for an empty curve.
    [[nodiscard]] double peak() const noexcept { return torque_nm.maxCoeff(); }

    /// Build a curve, checking every invariant.
    ///
    /// # Returns
    /// - `nullopt` if the inputs are empty, differ in length, rpm is not
    ///   strictly ascending, or any torque is non-finite or ≤ 0
    [[nodiscard]] static std::optional<BaselineCurve>
    make(std::vector<int> rpm_bins, const std::vector<double>& torque_nm);
};

// ─── Calibration ──────────────────────────────────────────────────────────────

/// The fixed set of engine-control parameters proposed with every delta.
enum class CalibrationParam : std::size_t {
    AfrTarget      = 0,  ///< Air-fuel ratio target
    IgnTimingDeg   = 1,  ///< Ignition timing advance, degrees
    BoostTargetPsi = 2,  ///< Boost pressure target, psi
};

inline constexpr std::size_t CALIBRATION_PARAM_COUNT = 3;

/// All parameters in sampling order.
inline constexpr std::array<CalibrationParam, CALIBRATION_PARAM_COUNT>
    ALL_CALIBRATION_PARAMS = {
        CalibrationParam::AfrTarget,
        CalibrationParam::IgnTimingDeg,
        CalibrationParam::BoostTargetPsi,
};

/// Wire name of a parameter ("afr_target", "ign_timing_deg", ...).
[[nodiscard]] std::string_view to_string(CalibrationParam param) noexcept;

/// Parse a wire name. Returns `nullopt` for unknown names.
[[nodiscard]] std::optional<CalibrationParam>
parse_calibration_param(std::string_view name) noexcept;

/// One value per calibration parameter.
struct Calibration {
    std::array<double, CALIBRATION_PARAM_COUNT> values{};

    [[nodiscard]] double operator[](CalibrationParam p) const noexcept {
        return values[static_cast<std::size_t>(p)];
    }
    [[nodiscard]] double& operator[](CalibrationParam p) noexcept {
        return values[static_cast<std::size_t>(p)];
    }

    bool operator==(const Calibration&) const = default;
};

/// Inclusive `[lo, hi]` range for one calibration parameter.
struct CalibrationRange {
    double lo;
    double hi;

    [[nodiscard]] bool contains(double v) const noexcept {
        return lo <= v && v <= hi;
    }
};

/// Built-in range used by the sampler when the request configures none.
[[nodiscard]] CalibrationRange default_range(CalibrationParam param) noexcept;

// ─── Constraints ──────────────────────────────────────────────────────────────

/// Smoothness limits on the delta curve.
struct SmoothnessLimits {
    /// Maximum |d[i+1] − 2·d[i] + d[i−1]| at any interior bin, in Nm.
    double max_second_derivative = constants::DEFAULT_MAX_SECOND_DERIVATIVE;
};

/// Immutable safety envelope for one optimization request.
struct Constraints {
    double max_peak_gain_ratio = constants::DEFAULT_MAX_PEAK_GAIN_RATIO;
    double max_bin_delta_nm    = constants::DEFAULT_MAX_BIN_DELTA_NM;
    double max_bin_delta_ratio = constants::DEFAULT_MAX_BIN_DELTA_RATIO;
    SmoothnessLimits smoothness{};

    /// Configured ranges. A parameter without an entry is unconstrained for
    /// validation and sampled from its default range.
    std::map<CalibrationParam, CalibrationRange> calibration_ranges{};

    /// Configured range for `param`, if any.
    [[nodiscard]] std::optional<CalibrationRange>
    range_for(CalibrationParam param) const noexcept;
};

} // namespace ecutune

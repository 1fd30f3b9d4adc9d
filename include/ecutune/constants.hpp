#pragma once

#include <cstddef>
#include <string_view>

/// @file include/ecutune/constants.hpp
/// @brief Default limits and numeric constants for the ecutune system.
///
/// Every default here mirrors the value the request contract falls back to
/// when a field is absent, so the core and the contract layer never disagree.

namespace ecutune::constants {

// ─── Contract ─────────────────────────────────────────────────────────────────

/// Version string carried by every request and response envelope.
inline constexpr std::string_view CONTRACT_VERSION = "1.0";

// ─── Constraint Defaults ──────────────────────────────────────────────────────

/// Maximum fractional increase of the curve's peak torque.
static constexpr double DEFAULT_MAX_PEAK_GAIN_RATIO = 0.02;

/// Maximum absolute per-bin torque change, in Nm.
static constexpr double DEFAULT_MAX_BIN_DELTA_NM = 8.0;

/// Maximum per-bin torque change relative to that bin's baseline torque.
static constexpr double DEFAULT_MAX_BIN_DELTA_RATIO = 0.03;

/// Maximum |Δ²delta| at any interior bin, in Nm.
static constexpr double DEFAULT_MAX_SECOND_DERIVATIVE = 0.15;

// ─── Calibration Defaults ─────────────────────────────────────────────────────
// Used by the sampler only when the request configures no range for a
// parameter. The validator never checks against these.

static constexpr double DEFAULT_AFR_TARGET_LO       = 12.5;
static constexpr double DEFAULT_AFR_TARGET_HI       = 13.5;
static constexpr double DEFAULT_IGN_TIMING_DEG_LO   = 0.0;
static constexpr double DEFAULT_IGN_TIMING_DEG_HI   = 4.0;
static constexpr double DEFAULT_BOOST_TARGET_PSI_LO = 0.0;
static constexpr double DEFAULT_BOOST_TARGET_PSI_HI = 14.0;

// ─── Search ───────────────────────────────────────────────────────────────────

/// Exploration scale reached on the last cycle (the first cycle uses 1.0).
static constexpr double DEFAULT_ANNEAL_FLOOR = 0.5;

/// Margin added to the minimum Gaussian width to form the sigma upper bound
/// on very short curves.
static constexpr double SIGMA_SPAN_MARGIN = 0.1;

/// Number of cycles the CLI quick mode runs when `--budget` is not given.
static constexpr std::size_t DEFAULT_CYCLE_BUDGET = 40;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Slack used by tests and self-checks when comparing against a limit.
static constexpr double FLOAT_EPSILON = 1e-9;

// ─── Response Rounding ────────────────────────────────────────────────────────

static constexpr int CONFIDENCE_DECIMALS      = 4;
static constexpr int PEAK_GAIN_DECIMALS       = 6;
static constexpr int BEST_SCORE_DECIMALS      = 4;
static constexpr int RUNTIME_MS_DECIMALS      = 2;

} // namespace ecutune::constants

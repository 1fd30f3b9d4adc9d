#pragma once

/// @file include/ecutune/validator.hpp
/// @brief ProposalValidator: hard safety checks on one candidate.
///
/// # Module: Proposal Validator
///
/// ## Responsibility
/// Decide whether a `(DeltaProfile, Calibration)` candidate is safe to
/// propose against a baseline curve and constraint record.
///
/// ## Check Order
/// Checks run in a fixed order and stop at the first violation:
///   1. delta, rpm_bins and baseline lengths agree (and are non-zero)
///   2. every delta is finite
///   3. every baseline torque is finite and > 0
///   4. |delta[i]| ≤ max_bin_delta_nm for every bin
///   5. |delta[i]| / baseline[i] ≤ max_bin_delta_ratio for every bin
///   6. peak gain of baseline + delta ≤ max_peak_gain_ratio
///      (a negative gain is allowed and produces a warning)
///   7. |d[i+1] − 2·d[i] + d[i−1]| ≤ max_second_derivative at interior bins
///   8. every calibration value finite and inside its configured range
///
/// ## Guarantees
/// - Pure: no state, no logging, no randomness
/// - Rejections are values, never exceptions
///
/// ## NOT Responsible For
/// - Repairing a candidate (the search loop simply discards it)

#include "ecutune/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ecutune::validation {

// ─── Outcome Types ────────────────────────────────────────────────────────────

/// The check that rejected a candidate.
enum class RejectionKind {
    LengthMismatch,
    NonFiniteDelta,
    InvalidBaseline,
    BinDeltaExceedsNm,
    BinDeltaExceedsRatio,
    PeakGainExceeded,
    SmoothnessViolation,
    CalibrationNonFinite,
    CalibrationOutOfRange,
};

/// Stable lower-case name of a rejection kind (used in logs and tallies).
[[nodiscard]] std::string_view to_string(RejectionKind kind) noexcept;

/// The candidate passed every check.
struct Accepted {
    std::vector<std::string> warnings;  ///< Non-fatal observations
};

/// The candidate violated a hard constraint.
struct Rejected {
    RejectionKind                   kind;
    std::optional<std::size_t>      bin;    ///< Offending bin, if per-bin
    std::optional<CalibrationParam> param;  ///< Offending parameter, if calibration
    std::string                     reason; ///< Human-readable description
};

using ValidationOutcome = std::variant<Accepted, Rejected>;

[[nodiscard]] inline bool is_accepted(const ValidationOutcome& o) noexcept {
    return std::holds_alternative<Accepted>(o);
}

// ─── Metrics ──────────────────────────────────────────────────────────────────

/// Fractional change of the curve's peak: (max(b + d) − max(b)) / max(b).
///
/// # Returns
/// `nullopt` if lengths differ, the curve is empty, or max(b) ≤ 0.
[[nodiscard]] std::optional<double>
peak_gain_ratio(const TorqueVector& baseline, const DeltaProfile& delta) noexcept;

/// |d[i+1] − 2·d[i] + d[i−1]| for every interior bin i (size n − 2, or 0).
[[nodiscard]] Eigen::VectorXd second_differences(const DeltaProfile& delta);

// ─── Validation ───────────────────────────────────────────────────────────────

/// Run every check on one candidate.
///
/// # Arguments
/// * `delta`       - Proposed per-bin torque change
/// * `calibration` - Proposed calibration values
/// * `baseline`    - Baseline torque, one entry per bin
/// * `rpm_bins`    - RPM of each bin (used for the structural length check)
/// * `constraints` - Safety envelope
[[nodiscard]] ValidationOutcome
validate_proposal(const DeltaProfile&   delta,
                  const Calibration&    calibration,
                  const TorqueVector&   baseline,
                  std::span<const int>  rpm_bins,
                  const Constraints&    constraints);

/// Convenience overload taking the baseline curve as one value.
[[nodiscard]] ValidationOutcome
validate_proposal(const DeltaProfile&  delta,
                  const Calibration&   calibration,
                  const BaselineCurve& baseline,
                  const Constraints&   constraints);

} // namespace ecutune::validation

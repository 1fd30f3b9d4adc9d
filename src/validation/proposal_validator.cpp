/// @file src/validation/proposal_validator.cpp
/// @brief ProposalValidator implementation.

#include "ecutune/validator.hpp"

#include <fmt/format.h>

#include <cmath>
#include <utility>

namespace ecutune::validation {

namespace {

Rejected reject(RejectionKind kind, std::string reason,
                std::optional<std::size_t> bin = std::nullopt,
                std::optional<CalibrationParam> param = std::nullopt) {
    return Rejected{
        .kind   = kind,
        .bin    = bin,
        .param  = param,
        .reason = std::move(reason),
    };
}

} // anonymous namespace

// ─── to_string ────────────────────────────────────────────────────────────────

std::string_view to_string(RejectionKind kind) noexcept {
    switch (kind) {
        case RejectionKind::LengthMismatch:        return "length_mismatch";
        case RejectionKind::NonFiniteDelta:        return "non_finite_delta";
        case RejectionKind::InvalidBaseline:       return "invalid_baseline";
        case RejectionKind::BinDeltaExceedsNm:     return "bin_delta_nm";
        case RejectionKind::BinDeltaExceedsRatio:  return "bin_delta_ratio";
        case RejectionKind::PeakGainExceeded:      return "peak_gain";
        case RejectionKind::SmoothnessViolation:   return "smoothness";
        case RejectionKind::CalibrationNonFinite:  return "calibration_non_finite";
        case RejectionKind::CalibrationOutOfRange: return "calibration_range";
    }
    return "unknown";
}

// ─── Metrics ──────────────────────────────────────────────────────────────────

std::optional<double>
peak_gain_ratio(const TorqueVector& baseline, const DeltaProfile& delta) noexcept {
    if (baseline.size() == 0 || baseline.size() != delta.size()) {
        return std::nullopt;
    }
    const double baseline_peak = baseline.maxCoeff();
    if (!(baseline_peak > 0.0)) {
        return std::nullopt;
    }
    const double proposed_peak = (baseline + delta).maxCoeff();
    return (proposed_peak - baseline_peak) / baseline_peak;
}

Eigen::VectorXd second_differences(const DeltaProfile& delta) {
    const Eigen::Index n = delta.size();
    if (n < 3) {
        return Eigen::VectorXd(0);
    }
    const Eigen::Index m = n - 2;
    return (delta.segment(2, m) - 2.0 * delta.segment(1, m) + delta.segment(0, m))
        .cwiseAbs();
}

// ─── validate_proposal ────────────────────────────────────────────────────────

ValidationOutcome
validate_proposal(const DeltaProfile&  delta,
                  const Calibration&   calibration,
                  const TorqueVector&  baseline,
                  std::span<const int> rpm_bins,
                  const Constraints&   constraints) {
    const auto n = static_cast<std::size_t>(delta.size());

    // ── 1. Structure ──────────────────────────────────────────────────────────
    if (n != rpm_bins.size()) {
        return reject(RejectionKind::LengthMismatch,
            fmt::format("torque_delta length {} != rpm_bins length {}",
                        n, rpm_bins.size()));
    }
    if (static_cast<std::size_t>(baseline.size()) != rpm_bins.size()) {
        return reject(RejectionKind::LengthMismatch,
            fmt::format("baseline_torque length {} != rpm_bins length {}",
                        baseline.size(), rpm_bins.size()));
    }
    if (n == 0) {
        return reject(RejectionKind::LengthMismatch, "torque_delta is empty");
    }

    // ── 2. Finite deltas ──────────────────────────────────────────────────────
    for (std::size_t i = 0; i < n; ++i) {
        const double d = delta(static_cast<Eigen::Index>(i));
        if (!std::isfinite(d)) {
            return reject(RejectionKind::NonFiniteDelta,
                fmt::format("torque_delta[{}] is not finite: {}", i, d), i);
        }
    }

    // ── 3. Baseline sanity ────────────────────────────────────────────────────
    for (std::size_t i = 0; i < n; ++i) {
        const double b = baseline(static_cast<Eigen::Index>(i));
        if (!std::isfinite(b) || b <= 0.0) {
            return reject(RejectionKind::InvalidBaseline,
                fmt::format("baseline_torque_nm[{}] is invalid: {}", i, b), i);
        }
    }

    // ── 4. Absolute per-bin limit ─────────────────────────────────────────────
    for (std::size_t i = 0; i < n; ++i) {
        const double d = delta(static_cast<Eigen::Index>(i));
        if (std::abs(d) > constraints.max_bin_delta_nm) {
            return reject(RejectionKind::BinDeltaExceedsNm,
                fmt::format("bin {} delta {:.4f} Nm exceeds max_bin_delta_nm {}",
                            i, d, constraints.max_bin_delta_nm), i);
        }
    }

    // ── 5. Relative per-bin limit ─────────────────────────────────────────────
    for (std::size_t i = 0; i < n; ++i) {
        const auto   idx   = static_cast<Eigen::Index>(i);
        const double ratio = std::abs(delta(idx)) / baseline(idx);
        if (ratio > constraints.max_bin_delta_ratio) {
            return reject(RejectionKind::BinDeltaExceedsRatio,
                fmt::format("bin {} delta ratio {:.4f} exceeds max_bin_delta_ratio {}",
                            i, ratio, constraints.max_bin_delta_ratio), i);
        }
    }

    // ── 6. Peak gain cap ──────────────────────────────────────────────────────
    std::vector<std::string> warnings;
    if (const auto gain = peak_gain_ratio(baseline, delta)) {
        if (*gain > constraints.max_peak_gain_ratio) {
            return reject(RejectionKind::PeakGainExceeded,
                fmt::format("peak gain ratio {:.4f} exceeds cap {}",
                            *gain, constraints.max_peak_gain_ratio));
        }
        if (*gain < 0.0) {
            warnings.push_back(fmt::format(
                "proposal reduces peak torque by {:.2f}%", std::abs(*gain) * 100.0));
        }
    }

    // ── 7. Smoothness of the delta curve ──────────────────────────────────────
    // Only the delta is ours to shape; the baseline arrives already valid.
    const double max_d2 = constraints.smoothness.max_second_derivative;
    const Eigen::VectorXd d2 = second_differences(delta);
    for (Eigen::Index k = 0; k < d2.size(); ++k) {
        if (d2(k) > max_d2) {
            const auto bin = static_cast<std::size_t>(k + 1);
            return reject(RejectionKind::SmoothnessViolation,
                fmt::format("smoothness violation at bin {}: "
                            "delta second_derivative={:.4f} > max {}",
                            bin, d2(k), max_d2), bin);
        }
    }

    // ── 8. Calibration ────────────────────────────────────────────────────────
    for (const auto param : ALL_CALIBRATION_PARAMS) {
        const double v = calibration[param];
        if (!std::isfinite(v)) {
            return reject(RejectionKind::CalibrationNonFinite,
                fmt::format("calibration.{} is not finite: {}", ecutune::to_string(param), v),
                std::nullopt, param);
        }
        if (const auto range = constraints.range_for(param); range && !range->contains(v)) {
            return reject(RejectionKind::CalibrationOutOfRange,
                fmt::format("calibration.{}={} outside allowed range [{}, {}]",
                            ecutune::to_string(param), v, range->lo, range->hi),
                std::nullopt, param);
        }
    }

    return Accepted{std::move(warnings)};
}

ValidationOutcome
validate_proposal(const DeltaProfile&  delta,
                  const Calibration&   calibration,
                  const BaselineCurve& baseline,
                  const Constraints&   constraints) {
    return validate_proposal(delta, calibration, baseline.torque_nm,
                             baseline.rpm_bins, constraints);
}

} // namespace ecutune::validation

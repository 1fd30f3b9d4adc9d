/// @file src/core/types.cpp
/// @brief BaselineCurve construction and calibration-parameter helpers.

#include "ecutune/types.hpp"

#include <cmath>
#include <utility>

namespace ecutune {

// ─── BaselineCurve::make ──────────────────────────────────────────────────────

std::optional<BaselineCurve>
BaselineCurve::make(std::vector<int> rpm_bins, const std::vector<double>& torque_nm) {
    if (rpm_bins.empty() || rpm_bins.size() != torque_nm.size()) {
        return std::nullopt;
    }

    for (std::size_t i = 1; i < rpm_bins.size(); ++i) {
        if (rpm_bins[i] <= rpm_bins[i - 1]) {
            return std::nullopt;
        }
    }

    TorqueVector torque(static_cast<Eigen::Index>(torque_nm.size()));
    for (std::size_t i = 0; i < torque_nm.size(); ++i) {
        const double t = torque_nm[i];
        if (!std::isfinite(t) || t <= 0.0) {
            return std::nullopt;
        }
        torque(static_cast<Eigen::Index>(i)) = t;
    }

    return BaselineCurve{
        .rpm_bins  = std::move(rpm_bins),
        .torque_nm = std::move(torque),
    };
}

// ─── CalibrationParam names ───────────────────────────────────────────────────

std::string_view to_string(CalibrationParam param) noexcept {
    switch (param) {
        case CalibrationParam::AfrTarget:      return "afr_target";
        case CalibrationParam::IgnTimingDeg:   return "ign_timing_deg";
        case CalibrationParam::BoostTargetPsi: return "boost_target_psi";
    }
    return "unknown";
}

std::optional<CalibrationParam>
parse_calibration_param(std::string_view name) noexcept {
    for (const auto p : ALL_CALIBRATION_PARAMS) {
        if (to_string(p) == name) {
            return p;
        }
    }
    return std::nullopt;
}

CalibrationRange default_range(CalibrationParam param) noexcept {
    using namespace constants;
    switch (param) {
        case CalibrationParam::AfrTarget:
            return {DEFAULT_AFR_TARGET_LO, DEFAULT_AFR_TARGET_HI};
        case CalibrationParam::IgnTimingDeg:
            return {DEFAULT_IGN_TIMING_DEG_LO, DEFAULT_IGN_TIMING_DEG_HI};
        case CalibrationParam::BoostTargetPsi:
            return {DEFAULT_BOOST_TARGET_PSI_LO, DEFAULT_BOOST_TARGET_PSI_HI};
    }
    return {0.0, 0.0};
}

// ─── Constraints ──────────────────────────────────────────────────────────────

std::optional<CalibrationRange>
Constraints::range_for(CalibrationParam param) const noexcept {
    const auto it = calibration_ranges.find(param);
    if (it == calibration_ranges.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace ecutune

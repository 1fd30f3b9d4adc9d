/// @file src/search/candidate_generator.cpp
/// @brief Gaussian delta-profile generation.

#include "ecutune/candidate.hpp"
#include "ecutune/constants.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ecutune::search {

// ─── Construction ─────────────────────────────────────────────────────────────

CandidateGenerator::CandidateGenerator(const BaselineCurve& baseline,
                                       const Constraints&   constraints)
    : baseline_(baseline)
    , constraints_(constraints)
    , limit_(baseline.torque_nm.size())
{
    const Eigen::Index n = baseline_.torque_nm.size();
    for (Eigen::Index i = 0; i < n; ++i) {
        limit_(i) = std::min(constraints_.max_bin_delta_nm,
                             baseline_.torque_nm(i) * constraints_.max_bin_delta_ratio);
    }
    global_limit_ = (n > 0) ? limit_.minCoeff() : 0.0;
}

// ─── CandidateGenerator::min_sigma ────────────────────────────────────────────

double CandidateGenerator::min_sigma(double peak, double max_second_derivative) noexcept {
    if (max_second_derivative <= 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return std::sqrt(peak / max_second_derivative);
}

// ─── CandidateGenerator::generate ─────────────────────────────────────────────

DeltaProfile CandidateGenerator::generate(RandomStream& rng, double scale) const {
    const Eigen::Index n = limit_.size();
    DeltaProfile delta = DeltaProfile::Zero(n);
    if (n == 0) {
        return delta;
    }

    const double max_d2 = constraints_.smoothness.max_second_derivative;
    const double limit  = global_limit_ * scale;
    // Negated comparisons also catch NaN limits.
    if (!(limit > 0.0) || !(max_d2 > 0.0)) {
        return delta;
    }

    const double peak = rng.uniform(0.0, limit);
    if (peak <= 0.0) {
        return delta;
    }

    const double sigma_lo = min_sigma(peak, max_d2);
    const double sigma_hi = std::max(static_cast<double>(n),
                                     sigma_lo + constants::SIGMA_SPAN_MARGIN);
    const double sigma    = rng.uniform(sigma_lo, sigma_hi);
    const double center   = rng.uniform(0.0, static_cast<double>(n - 1));

    for (Eigen::Index i = 0; i < n; ++i) {
        const double z = (static_cast<double>(i) - center) / sigma;
        const double d = peak * std::exp(-0.5 * z * z);
        // The width choice already bounds d; the clamp covers rounding only.
        delta(i) = std::clamp(d, 0.0, limit_(i));
    }

    return delta;
}

} // namespace ecutune::search

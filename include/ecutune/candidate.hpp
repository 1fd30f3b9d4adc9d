#pragma once

/// @file include/ecutune/candidate.hpp
/// @brief CandidateGenerator and CalibrationSampler: per-cycle proposals.
///
/// # Module: Candidate Generation
///
/// ## Responsibility
/// Turn draws from a RandomStream into one `(DeltaProfile, Calibration)`
/// candidate per search cycle.
///
/// ## Gaussian Delta Profiles
/// Independent per-bin random deltas almost never satisfy the smoothness
/// limit. A Gaussian bell
/// ```
/// d(i) = peak · exp(−½ · ((i − center) / σ)²)
/// ```
/// has a maximum curvature of about `peak / σ²`, so choosing
/// ```
/// σ ≥ √(peak / max_second_derivative)
/// ```
/// keeps every interior second difference within the limit before the
/// validator ever sees the candidate. No reject-and-retry loop is needed.
///
/// ## Guarantees
/// - Every generated delta is finite, non-negative and ≤ the per-bin ceiling
///   `L[i] = min(max_bin_delta_nm, baseline[i] · max_bin_delta_ratio)`
/// - Draw order per call is fixed: peak, sigma, center (generator) and
///   afr_target, ign_timing_deg, boost_target_psi (sampler)
///
/// ## NOT Responsible For
/// - Checking the peak-gain cap or calibration ranges (see validator.hpp)

#include "ecutune/random_stream.hpp"
#include "ecutune/types.hpp"

namespace ecutune::search {

// ─── CandidateGenerator ───────────────────────────────────────────────────────

/// Builds smooth, bounded Gaussian delta profiles for one baseline curve.
///
/// The per-bin ceilings are computed once at construction; `generate` is then
/// a pure function of the stream state and the exploration scale.
class CandidateGenerator {
public:
    /// Precompute per-bin ceilings for `baseline` under `constraints`.
    ///
    /// Both references must outlive the generator.
    CandidateGenerator(const BaselineCurve& baseline, const Constraints& constraints);

    /// Draw one delta profile.
    ///
    /// # Arguments
    /// * `rng`   - Stream to draw from (advanced by 0 or 1 or 3 draws)
    /// * `scale` - Exploration scale in (0, 1]; shrinks the peak amplitude
    ///
    /// # Returns
    /// A profile of `baseline.size()` entries. All-zero (without drawing) if
    /// the scaled ceiling or the smoothness limit is ≤ 0; all-zero (after one
    /// draw) if the sampled peak is 0.
    [[nodiscard]] DeltaProfile generate(RandomStream& rng, double scale) const;

    /// Per-bin ceiling `L[i]`.
    [[nodiscard]] const TorqueVector& per_bin_limit() const noexcept { return limit_; }

    /// `min(L)` - the largest peak any profile may reach at scale 1.
    [[nodiscard]] double global_limit() const noexcept { return global_limit_; }

    /// Smallest Gaussian width whose curvature stays within `max_second_derivative`.
    ///
    /// Returns +∞ when `max_second_derivative` ≤ 0.
    [[nodiscard]] static double min_sigma(double peak, double max_second_derivative) noexcept;

private:
    const BaselineCurve& baseline_;
    const Constraints&   constraints_;
    TorqueVector         limit_;
    double               global_limit_ = 0.0;
};

// ─── CalibrationSampler ───────────────────────────────────────────────────────

/// Draws calibration values uniformly within the configured ranges.
class CalibrationSampler {
public:
    CalibrationSampler() = delete;

    /// Sample every parameter in `ALL_CALIBRATION_PARAMS` order.
    ///
    /// Uses the configured range when present, otherwise `default_range()`.
    /// Inverted bounds are swapped before sampling. Always draws exactly
    /// `CALIBRATION_PARAM_COUNT` values.
    [[nodiscard]] static Calibration sample(RandomStream& rng,
                                            const Constraints& constraints) noexcept;

    /// The range `sample` draws `param` from (configured or default, ordered).
    [[nodiscard]] static CalibrationRange
    sampling_range(CalibrationParam param, const Constraints& constraints) noexcept;
};

} // namespace ecutune::search

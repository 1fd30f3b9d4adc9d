#pragma once

/// @file include/ecutune/search.hpp
/// @brief SearchLoop and ResultAssembler: bounded best-of-budget search.
///
/// # Module: Search Loop
///
/// ## Responsibility
/// Run exactly `cycle_budget` generate → validate → score → keep-best cycles
/// from one seed and return the best constraint-satisfying candidate.
///
/// ## Pipeline (per run)
/// ```
/// RandomStream(seed)
///   → initial calibration              (CalibrationSampler)
///   → for each cycle:
///       scale = 1 − (cycle / budget) · (1 − anneal_floor)
///       delta       ← CandidateGenerator(scale)
///       calibration ← CalibrationSampler
///       validate    → discard on Rejected
///       score = Σ(baseline + delta); keep if strictly better
///   → ResultAssembler (peak gain, confidence, fresh warnings)
/// ```
/// The untouched baseline (zero delta) is the starting best and is always
/// valid, so a run never fails: it degrades to "no improvement found".
///
/// ## Guarantees
/// - Deterministic: identical inputs and seed give bit-identical results
/// - Never throws on constraint violations; only allocation can fail
/// - No timeouts: the budget is the only termination condition
///
/// ## NOT Responsible For
/// - Request parsing or response envelopes (see contract.hpp)
/// - Wall-clock ceilings (enforced by the caller around the whole request)

#include "ecutune/candidate.hpp"
#include "ecutune/constants.hpp"
#include "ecutune/types.hpp"
#include "ecutune/validator.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace ecutune::search {

// ─── SearchConfig ─────────────────────────────────────────────────────────────

/// Run-time knobs for the search loop.
struct SearchConfig {
    /// Exploration scale on the final cycle. The schedule narrows linearly
    /// from 1.0 toward this value across the budget.
    double anneal_floor = constants::DEFAULT_ANNEAL_FLOOR;

    /// If true, log every cycle's outcome at debug level.
    bool verbose = false;
};

// ─── SearchResult ─────────────────────────────────────────────────────────────

/// Outcome of one search run. Immutable once returned.
struct SearchResult {
    DeltaProfile delta;                    ///< Best delta (zero if none improved)
    Calibration  calibration;              ///< Calibration paired with `delta`
    double       best_score = 0.0;         ///< Σ(baseline + delta)
    double       estimated_peak_gain_ratio = 0.0;
    double       confidence = 0.0;         ///< Gain as a fraction of the cap, in [0, 1]
    std::vector<std::string> warnings;     ///< From re-validating the returned candidate

    std::size_t cycles_used       = 0;
    std::size_t accepted_count    = 0;
    std::size_t rejected_count    = 0;
    std::size_t improvement_count = 0;

    /// Rejections per validator check.
    std::map<validation::RejectionKind, std::size_t> rejections{};

    /// One-line summary for logs.
    [[nodiscard]] std::string to_string() const;
};

// ─── ResultAssembler ──────────────────────────────────────────────────────────

/// Derives the final metrics from the retained best candidate.
class ResultAssembler {
public:
    ResultAssembler() = delete;

    /// Confidence = clamp(gain / max_peak_gain_ratio, 0, 1).
    ///
    /// Measures proximity to the allowed gain ceiling, not a statistical
    /// interval. Returns 0 when the cap is ≤ 0 or either input is non-finite.
    [[nodiscard]] static double confidence(double peak_gain_ratio,
                                           double max_peak_gain_ratio) noexcept;

    /// Fill `result.estimated_peak_gain_ratio`, `confidence` and `warnings`
    /// from `result.delta` / `result.calibration`.
    ///
    /// Warnings come from validating the returned candidate once more. If that
    /// validation rejects (possible only with constraints the request contract
    /// refuses), the rejection reason is reported as a warning.
    static void finalize(SearchResult&        result,
                         const BaselineCurve& baseline,
                         const Constraints&   constraints);
};

// ─── SearchLoop ───────────────────────────────────────────────────────────────

/// Seeded best-of-budget search over Gaussian delta profiles.
class SearchLoop {
public:
    explicit SearchLoop(SearchConfig config = SearchConfig{});

    /// Run `cycle_budget` cycles from `seed`.
    ///
    /// # Arguments
    /// * `baseline`     - Validated baseline curve
    /// * `constraints`  - Safety envelope
    /// * `cycle_budget` - Number of cycles (0 returns the baseline untouched)
    /// * `seed`         - Seed for the run's RandomStream
    [[nodiscard]] SearchResult run(const BaselineCurve& baseline,
                                   const Constraints&   constraints,
                                   std::size_t          cycle_budget,
                                   std::int64_t         seed) const;

    /// Exploration scale for `cycle` of `cycle_budget`.
    ///
    /// `1 − (cycle / budget) · (1 − floor)`; 1.0 when the budget is 0.
    [[nodiscard]] static double exploration_scale(std::size_t cycle,
                                                  std::size_t cycle_budget,
                                                  double      anneal_floor) noexcept;

    /// Σ(baseline + delta). Higher is better.
    [[nodiscard]] static double score(const TorqueVector& baseline,
                                      const DeltaProfile& delta) noexcept;

    [[nodiscard]] const SearchConfig& config() const noexcept { return config_; }

private:
    SearchConfig config_;
};

} // namespace ecutune::search

/// @file src/search/search_loop.cpp
/// @brief SearchLoop implementation.

#include "ecutune/search.hpp"
#include "ecutune/log.hpp"
#include "ecutune/random_stream.hpp"

#include <utility>
#include <variant>

namespace ecutune::search {

namespace {

constexpr std::string_view COMPONENT = "search";

} // anonymous namespace

// ─── SearchLoop constructor ───────────────────────────────────────────────────

SearchLoop::SearchLoop(SearchConfig config)
    : config_(std::move(config))
{}

// ─── SearchLoop::exploration_scale ────────────────────────────────────────────

double SearchLoop::exploration_scale(std::size_t cycle,
                                     std::size_t cycle_budget,
                                     double      anneal_floor) noexcept {
    if (cycle_budget == 0) {
        return 1.0;
    }
    const double progress = static_cast<double>(cycle) / static_cast<double>(cycle_budget);
    return 1.0 - progress * (1.0 - anneal_floor);
}

// ─── SearchLoop::score ────────────────────────────────────────────────────────

double SearchLoop::score(const TorqueVector& baseline, const DeltaProfile& delta) noexcept {
    // Sequential left-to-right sum: the result must not depend on how the
    // build vectorizes Eigen reductions.
    double total = 0.0;
    for (Eigen::Index i = 0; i < baseline.size(); ++i) {
        total += baseline(i) + delta(i);
    }
    return total;
}

// ─── SearchLoop::run ──────────────────────────────────────────────────────────

SearchResult SearchLoop::run(const BaselineCurve& baseline,
                             const Constraints&   constraints,
                             std::size_t          cycle_budget,
                             std::int64_t         seed) const {
    RandomStream             rng(seed);
    const CandidateGenerator generator(baseline, constraints);

    SearchResult result;
    result.delta       = DeltaProfile::Zero(baseline.torque_nm.size());
    result.best_score  = score(baseline.torque_nm, result.delta);
    result.calibration = CalibrationSampler::sample(rng, constraints);

    for (std::size_t cycle = 0; cycle < cycle_budget; ++cycle) {
        ++result.cycles_used;

        const double scale = exploration_scale(cycle, cycle_budget, config_.anneal_floor);

        // Draw order is part of the reproducibility contract: delta, then calibration.
        DeltaProfile candidate_delta       = generator.generate(rng, scale);
        Calibration  candidate_calibration = CalibrationSampler::sample(rng, constraints);

        const auto outcome = validation::validate_proposal(
            candidate_delta, candidate_calibration, baseline, constraints);

        if (const auto* rejected = std::get_if<validation::Rejected>(&outcome)) {
            ++result.rejected_count;
            ++result.rejections[rejected->kind];
            if (config_.verbose) {
                log::debug(COMPONENT, "cycle {}: rejected ({})", cycle, rejected->reason);
            }
            continue;
        }

        ++result.accepted_count;
        const double candidate_score = score(baseline.torque_nm, candidate_delta);

        if (candidate_score > result.best_score) {
            result.delta       = std::move(candidate_delta);
            result.calibration = candidate_calibration;
            result.best_score  = candidate_score;
            ++result.improvement_count;
            if (config_.verbose) {
                log::debug(COMPONENT, "cycle {}: new best score={:.4f} scale={:.3f}",
                           cycle, candidate_score, scale);
            }
        } else if (config_.verbose) {
            log::debug(COMPONENT, "cycle {}: accepted, score={:.4f} not better",
                       cycle, candidate_score);
        }
    }

    ResultAssembler::finalize(result, baseline, constraints);
    return result;
}

} // namespace ecutune::search

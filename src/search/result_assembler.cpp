/// @file src/search/result_assembler.cpp
/// @brief Final metrics for a search run, plus SearchResult::to_string.

#include "ecutune/search.hpp"
#include "ecutune/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <variant>

namespace ecutune::search {

// ─── ResultAssembler::confidence ──────────────────────────────────────────────

double ResultAssembler::confidence(double peak_gain_ratio,
                                   double max_peak_gain_ratio) noexcept {
    if (!std::isfinite(peak_gain_ratio) || !std::isfinite(max_peak_gain_ratio) ||
        max_peak_gain_ratio <= 0.0) {
        return 0.0;
    }
    return std::clamp(peak_gain_ratio / max_peak_gain_ratio, 0.0, 1.0);
}

// ─── ResultAssembler::finalize ────────────────────────────────────────────────

void ResultAssembler::finalize(SearchResult&        result,
                               const BaselineCurve& baseline,
                               const Constraints&   constraints) {
    result.estimated_peak_gain_ratio =
        validation::peak_gain_ratio(baseline.torque_nm, result.delta).value_or(0.0);
    result.confidence =
        confidence(result.estimated_peak_gain_ratio, constraints.max_peak_gain_ratio);

    // Re-validate what is actually returned rather than keeping the warnings
    // captured when this candidate was first accepted.
    auto outcome = validation::validate_proposal(
        result.delta, result.calibration, baseline, constraints);

    if (auto* accepted = std::get_if<validation::Accepted>(&outcome)) {
        result.warnings = std::move(accepted->warnings);
        return;
    }

    const auto& rejected = std::get<validation::Rejected>(outcome);
    log::warn("search", "returned candidate fails validation: {}", rejected.reason);
    result.warnings = {rejected.reason};
}

// ─── SearchResult::to_string ──────────────────────────────────────────────────

std::string SearchResult::to_string() const {
    return fmt::format(
        "cycles={} accepted={} rejected={} improvements={} "
        "best_score={:.4f} peak_gain={:.6f} confidence={:.4f}",
        cycles_used, accepted_count, rejected_count, improvement_count,
        best_score, estimated_peak_gain_ratio, confidence);
}

} // namespace ecutune::search

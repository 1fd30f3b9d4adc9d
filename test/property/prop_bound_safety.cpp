/**
 * @file  prop_bound_safety.cpp
 * @brief Property: every returned delta respects the per-bin and peak-gain caps
 *
 * Run with 1,000 random inputs:
 *   RC_PARAMS="max_success=1000" ./prop_bound_safety
 *
 *   |delta[i]| ≤ max_bin_delta_nm + ε
 *   |delta[i]| / baseline[i] ≤ max_bin_delta_ratio + ε
 *   peak_gain_ratio(baseline + delta) ≤ max_peak_gain_ratio + ε
 *
 * for any curve, any accepted constraint record, any seed and budget.
 */

#include <rapidcheck.h>

#include "curve_gen.hpp"
#include "ecutune/constants.hpp"
#include "ecutune/search.hpp"

#include <cmath>
#include <cstdint>

using namespace ecutune;
using namespace ecutune::search;
using ecutune::constants::FLOAT_EPSILON;

int main() {
    bool ok = true;

    // ── Property 1: per-bin caps ─────────────────────────────────────────────
    ok &= rc::check(
        "bound_safety: |delta| within absolute and relative per-bin caps",
        [](std::int64_t seed) {
            const auto curve  = prop::gen_curve();
            const auto c      = prop::gen_constraints();
            const auto budget = static_cast<std::size_t>(*rc::gen::inRange(1, 40));

            const auto r = SearchLoop{}.run(curve, c, budget, seed);

            RC_ASSERT(static_cast<std::size_t>(r.delta.size()) == curve.size());
            for (Eigen::Index i = 0; i < r.delta.size(); ++i) {
                RC_ASSERT(std::isfinite(r.delta(i)));
                RC_ASSERT(std::abs(r.delta(i)) <= c.max_bin_delta_nm + FLOAT_EPSILON);
                RC_ASSERT(std::abs(r.delta(i)) / curve.torque_nm(i)
                          <= c.max_bin_delta_ratio + FLOAT_EPSILON);
            }
        }
    );

    // ── Property 2: peak-gain cap ────────────────────────────────────────────
    ok &= rc::check(
        "bound_safety: estimated peak gain never exceeds the cap",
        [](std::int64_t seed) {
            const auto curve = prop::gen_curve();
            const auto c     = prop::gen_constraints();

            const auto r = SearchLoop{}.run(curve, c, 25, seed);

            RC_ASSERT(r.estimated_peak_gain_ratio <= c.max_peak_gain_ratio + FLOAT_EPSILON);
            RC_ASSERT(r.confidence >= 0.0);
            RC_ASSERT(r.confidence <= 1.0);
        }
    );

    return ok ? 0 : 1;
}

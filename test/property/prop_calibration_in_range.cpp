/**
 * @file  prop_calibration_in_range.cpp
 * @brief Property: every returned calibration value lies in its configured range
 *
 * Run with 1,000 random inputs:
 *   RC_PARAMS="max_success=1000" ./prop_calibration_in_range
 *
 * Parameters without a configured range are sampled from the built-in default
 * range; both cases are checked.
 */

#include <rapidcheck.h>

#include "curve_gen.hpp"
#include "ecutune/candidate.hpp"
#include "ecutune/search.hpp"

#include <cmath>
#include <cstdint>

using namespace ecutune;
using namespace ecutune::search;

int main() {
    bool ok = true;

    // ── Property 1: search result calibration in range ───────────────────────
    ok &= rc::check(
        "calibration_in_range: returned calibration inside configured ranges",
        [](std::int64_t seed) {
            const auto curve  = prop::gen_curve();
            const auto c      = prop::gen_constraints();
            const auto budget = static_cast<std::size_t>(*rc::gen::inRange(1, 30));

            const auto r = SearchLoop{}.run(curve, c, budget, seed);
            for (const auto p : ALL_CALIBRATION_PARAMS) {
                const double v = r.calibration[p];
                RC_ASSERT(std::isfinite(v));
                RC_ASSERT(CalibrationSampler::sampling_range(p, c).contains(v));
            }
        }
    );

    // ── Property 2: sampler alone, including unconfigured parameters ─────────
    ok &= rc::check(
        "calibration_in_range: sampler honours configured and default ranges",
        [](std::int64_t seed) {
            const auto c = prop::gen_constraints();
            RandomStream rng(seed);
            for (int k = 0; k < 50; ++k) {
                const auto cal = CalibrationSampler::sample(rng, c);
                for (const auto p : ALL_CALIBRATION_PARAMS) {
                    const auto range = c.range_for(p).value_or(default_range(p));
                    RC_ASSERT(range.contains(cal[p]));
                }
            }
        }
    );

    return ok ? 0 : 1;
}

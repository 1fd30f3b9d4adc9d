/// @file src/search/calibration_sampler.cpp
/// @brief Uniform calibration sampling within configured ranges.

#include "ecutune/candidate.hpp"

#include <utility>

namespace ecutune::search {

CalibrationRange
CalibrationSampler::sampling_range(CalibrationParam param,
                                   const Constraints& constraints) noexcept {
    CalibrationRange r = constraints.range_for(param).value_or(default_range(param));
    if (r.lo > r.hi) {
        std::swap(r.lo, r.hi);
    }
    return r;
}

Calibration CalibrationSampler::sample(RandomStream& rng,
                                       const Constraints& constraints) noexcept {
    Calibration cal;
    for (const auto param : ALL_CALIBRATION_PARAMS) {
        const CalibrationRange r = sampling_range(param, constraints);
        cal[param] = rng.uniform(r.lo, r.hi);
    }
    return cal;
}

} // namespace ecutune::search

/**
 * @file  fuzz_validator.cpp
 * @brief libFuzzer target for ProposalValidator
 *
 * Build:
 *   cmake -DECUTUNE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_validator
 *
 * Input layout: the byte stream is reinterpreted as doubles.
 *   [0]      bin count selector
 *   [1..7]   constraint scalars and calibration values
 *   rest     alternating baseline / delta values
 *
 * Invariants verified on every input:
 *   1. No crash, no UB, no exception for any values (NaN, ±inf, denormals).
 *   2. With finite non-negative limits (the only ones the request contract
 *      lets through), accepted ⇒ every delta finite and within the per-bin caps, peak gain
 *      within cap, second differences within the smoothness limit.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include "ecutune/validator.hpp"

using namespace ecutune;

namespace {

double read_double(const uint8_t* data, size_t size, size_t index) {
    double v = 0.0;
    if ((index + 1) * sizeof(double) <= size) {
        std::memcpy(&v, data + index * sizeof(double), sizeof(double));
    }
    return v;
}

} // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const size_t count = size / sizeof(double);
    if (count < 8) {
        return 0;
    }

    const auto n = static_cast<size_t>(
        std::fabs(std::fmod(read_double(data, size, 0), 32.0)));

    Constraints c;
    c.max_peak_gain_ratio = read_double(data, size, 1);
    c.max_bin_delta_nm    = read_double(data, size, 2);
    c.max_bin_delta_ratio = read_double(data, size, 3);
    c.smoothness.max_second_derivative = read_double(data, size, 4);
    c.calibration_ranges[CalibrationParam::AfrTarget] = {11.5, 14.7};

    Calibration cal;
    cal[CalibrationParam::AfrTarget]      = read_double(data, size, 5);
    cal[CalibrationParam::IgnTimingDeg]   = read_double(data, size, 6);
    cal[CalibrationParam::BoostTargetPsi] = read_double(data, size, 7);

    std::vector<int> rpm;
    TorqueVector baseline(static_cast<Eigen::Index>(n));
    DeltaProfile delta(static_cast<Eigen::Index>(n));
    for (size_t i = 0; i < n; ++i) {
        rpm.push_back(1000 + static_cast<int>(i) * 500);
        baseline(static_cast<Eigen::Index>(i)) = read_double(data, size, 8 + 2 * i);
        delta(static_cast<Eigen::Index>(i))    = read_double(data, size, 9 + 2 * i);
    }

    const auto outcome = validation::validate_proposal(delta, cal, baseline, rpm, c);
    if (!validation::is_accepted(outcome)) {
        return 0;
    }

    for (const double limit : {c.max_peak_gain_ratio, c.max_bin_delta_nm,
                               c.max_bin_delta_ratio, c.smoothness.max_second_derivative}) {
        if (!std::isfinite(limit) || limit < 0.0) {
            return 0;
        }
    }

    for (size_t i = 0; i < n; ++i) {
        const auto idx = static_cast<Eigen::Index>(i);
        assert(std::isfinite(delta(idx)));
        assert(std::abs(delta(idx)) <= c.max_bin_delta_nm);
        assert(std::abs(delta(idx)) / baseline(idx) <= c.max_bin_delta_ratio);
    }
    const auto gain = validation::peak_gain_ratio(baseline, delta);
    assert(gain.has_value() && *gain <= c.max_peak_gain_ratio);
    const auto d2 = validation::second_differences(delta);
    for (Eigen::Index i = 0; i < d2.size(); ++i) {
        assert(d2(i) <= c.smoothness.max_second_derivative);
    }
    assert(c.calibration_ranges[CalibrationParam::AfrTarget]
               .contains(cal[CalibrationParam::AfrTarget]));
    return 0;
}

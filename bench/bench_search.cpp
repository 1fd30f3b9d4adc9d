/**
 * @file  bench/bench_search.cpp
 * @brief Google Benchmark suite for the ecutune search loop.
 *
 * Benchmarks
 * ----------
 *   BM_SearchLoop_Run            - full run, bins × budget grid
 *   BM_CandidateGenerator        - one Gaussian profile
 *   BM_ProposalValidator         - one validation pass
 *   BM_Runner_Handle             - JSON text in, JSON text out
 *
 * Build (CMake):
 *   cmake -DECUTUNE_BENCH=ON ..
 *   cmake --build build --target bench_search
 *   ./build/bench_search --benchmark_format=json
 *
 * Custom counter "cycles_per_sec" = search cycles completed per second.
 */

#include "benchmark/benchmark.h"

#include "ecutune/candidate.hpp"
#include "ecutune/log.hpp"
#include "ecutune/runner.hpp"
#include "ecutune/search.hpp"
#include "ecutune/validator.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// A smooth synthetic dyno curve with `n` bins peaking two thirds of the way up.
static ecutune::BaselineCurve make_curve(std::size_t n) {
    std::vector<int>    rpm(n);
    std::vector<double> torque(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i) / static_cast<double>(n > 1 ? n - 1 : 1);
        rpm[i]    = 1000 + static_cast<int>(i) * 250;
        torque[i] = 180.0 + 70.0 * std::exp(-8.0 * (x - 0.66) * (x - 0.66));
    }
    return *ecutune::BaselineCurve::make(std::move(rpm), torque);
}

static ecutune::Constraints make_constraints() {
    ecutune::Constraints c;
    c.calibration_ranges[ecutune::CalibrationParam::AfrTarget]      = {11.5, 14.7};
    c.calibration_ranges[ecutune::CalibrationParam::IgnTimingDeg]   = {-2.0, 8.0};
    c.calibration_ranges[ecutune::CalibrationParam::BoostTargetPsi] = {0.0, 22.0};
    return c;
}

// ── Search loop ────────────────────────────────────────────────────────────────

static void BM_SearchLoop_Run(benchmark::State& state) {
    const auto curve  = make_curve(static_cast<std::size_t>(state.range(0)));
    const auto c      = make_constraints();
    const auto budget = static_cast<std::size_t>(state.range(1));
    const ecutune::search::SearchLoop loop;

    std::int64_t seed = 0;
    for (auto _ : state) {
        auto r = loop.run(curve, c, budget, seed++);
        benchmark::DoNotOptimize(r.best_score);
    }
    state.counters["cycles_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()) * static_cast<double>(budget),
        benchmark::Counter::kIsRate);
}
BENCHMARK(BM_SearchLoop_Run)
    ->ArgsProduct({{5, 17, 64}, {20, 200, 2000}})
    ->Unit(benchmark::kMicrosecond);

// ── Components ─────────────────────────────────────────────────────────────────

static void BM_CandidateGenerator(benchmark::State& state) {
    const auto curve = make_curve(static_cast<std::size_t>(state.range(0)));
    const auto c     = make_constraints();
    const ecutune::search::CandidateGenerator gen(curve, c);
    ecutune::RandomStream rng(777);

    for (auto _ : state) {
        auto d = gen.generate(rng, 1.0);
        benchmark::DoNotOptimize(d.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_CandidateGenerator)->RangeMultiplier(4)->Range(4, 256);

static void BM_ProposalValidator(benchmark::State& state) {
    const auto curve = make_curve(static_cast<std::size_t>(state.range(0)));
    const auto c     = make_constraints();
    const ecutune::search::CandidateGenerator gen(curve, c);
    ecutune::RandomStream rng(777);
    const auto delta = gen.generate(rng, 0.5);
    const auto cal   = ecutune::search::CalibrationSampler::sample(rng, c);

    for (auto _ : state) {
        auto outcome = ecutune::validation::validate_proposal(delta, cal, curve, c);
        benchmark::DoNotOptimize(outcome);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_ProposalValidator)->RangeMultiplier(4)->Range(4, 256);

// ── End to end ─────────────────────────────────────────────────────────────────

static void BM_Runner_Handle(benchmark::State& state) {
    ecutune::log::set_level(ecutune::log::Level::Error);
    const auto curve = make_curve(17);

    const nlohmann::json request = {
        {"contract_version", "1.0"},
        {"request_id", "bench"},
        {"seed", 777},
        {"cycle_budget", state.range(0)},
        {"baseline_curve", {
            {"rpm_bins",  curve.rpm_bins},
            {"torque_nm", std::vector<double>(curve.torque_nm.data(),
                                              curve.torque_nm.data() + curve.torque_nm.size())},
        }},
        {"constraints", {{"max_peak_gain_ratio", 0.02}}},
    };
    const std::string text = request.dump();
    const ecutune::core::Runner runner;

    for (auto _ : state) {
        auto out = runner.handle(text);
        benchmark::DoNotOptimize(out.data());
    }
}
BENCHMARK(BM_Runner_Handle)->Arg(20)->Arg(200)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();

/**
 * @file  fuzz_request.cpp
 * @brief libFuzzer target for the full request → response pipeline
 *
 * Build:
 *   cmake -DECUTUNE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_request
 *
 * Run for 60 seconds:
 *   ./fuzz_request -max_total_time=60
 *
 * Invariants verified on every input:
 *   1. No crash, no UB, no uncaught exception for any byte sequence.
 *   2. The output is valid JSON carrying contract_version "1.0".
 *   3. status ∈ {ok, rejected, error}; error responses carry a code.
 *   4. ok responses carry only finite deltas.
 *
 * Inputs above 64 KiB, and requests asking for more than 1000 cycles, are
 * skipped: they are only slow, not interesting.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "ecutune/log.hpp"
#include "ecutune/runner.hpp"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size > 64 * 1024) {
        return 0;
    }
    static const bool quiet = [] {
        ecutune::log::set_level(ecutune::log::Level::Error);
        return true;
    }();
    (void)quiet;

    const std::string_view input{reinterpret_cast<const char*>(data), size};

    const auto probe = nlohmann::json::parse(input, nullptr, /*allow_exceptions=*/false);
    if (probe.is_object() && probe.contains("cycle_budget") &&
        probe["cycle_budget"].is_number() &&
        probe["cycle_budget"].get<double>() > 1000.0) {
        return 0;
    }

    static const ecutune::core::Runner runner;
    const std::string out = runner.handle(input);

    const auto resp = nlohmann::json::parse(out);
    assert(resp["contract_version"] == "1.0");

    const std::string status = resp["status"].get<std::string>();
    assert(status == "ok" || status == "rejected" || status == "error");

    if (status == "error") {
        assert(resp["error"]["code"].is_string());
    }
    if (status == "ok") {
        for (const auto& d : resp["proposal"]["torque_delta_nm"]) {
            assert(std::isfinite(d.get<double>()));
        }
    }
    return 0;
}

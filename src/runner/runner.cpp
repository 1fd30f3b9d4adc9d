/// @file src/runner/runner.cpp
/// @brief Runner: request text to response text.

#include "ecutune/runner.hpp"
#include "ecutune/log.hpp"
#include "ecutune/validator.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <utility>
#include <variant>

namespace ecutune::core {

namespace {

constexpr std::string_view COMPONENT = "runner";

bool is_blank(std::string_view text) noexcept {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    });
}

/// Drop repeated warnings, keeping first-seen order.
std::vector<std::string> dedupe(std::vector<std::string> items) {
    std::vector<std::string> out;
    out.reserve(items.size());
    for (auto& s : items) {
        if (std::find(out.begin(), out.end(), s) == out.end()) {
            out.push_back(std::move(s));
        }
    }
    return out;
}

} // anonymous namespace

// ─── Runner constructor ───────────────────────────────────────────────────────

Runner::Runner(RunnerConfig config)
    : config_(std::move(config))
{}

// ─── Runner::exit_code ────────────────────────────────────────────────────────

int Runner::exit_code(const contract::Response& response) noexcept {
    return response.status == contract::Status::Error ? 1 : 0;
}

// ─── Runner::process ──────────────────────────────────────────────────────────

contract::Response Runner::process(const contract::Request& request) const {
    log::info(COMPONENT, "processing request_id={} seed={} cycle_budget={} bins={}",
              request.request_id, request.seed, request.cycle_budget,
              request.baseline.size());

    const auto t_start = std::chrono::steady_clock::now();

    search::SearchResult result;
    try {
        const search::SearchLoop loop(config_.search);
        result = loop.run(request.baseline, request.constraints,
                          request.cycle_budget, request.seed);
    } catch (const std::exception& e) {
        log::error(COMPONENT, "optimizer raised an unexpected error: {}", e.what());
        return contract::make_error_response(request.request_id,
                                             contract::codes::OPTIMIZER_ERROR, e.what());
    }

    log::info(COMPONENT, "optimization complete: {}", result.to_string());

    // ── Final self-validation of what is about to leave the process ───────────
    const auto outcome = validation::validate_proposal(
        result.delta, result.calibration, request.baseline, request.constraints);
    if (const auto* rejected = std::get_if<validation::Rejected>(&outcome)) {
        log::warn(COMPONENT, "final validation rejected proposal: {}", rejected->reason);
        return contract::make_rejected_response(
            request.request_id,
            {rejected->reason},
            {"Proposal failed final self-validation. Returning rejected."});
    }

    // ── Hard safety gate on the numbers themselves ────────────────────────────
    for (Eigen::Index i = 0; i < result.delta.size(); ++i) {
        if (!std::isfinite(result.delta(i))) {
            log::error(COMPONENT, "non-finite value in torque_delta_nm[{}]: {}",
                       i, result.delta(i));
            return contract::make_error_response(
                request.request_id, contract::codes::NON_FINITE_OUTPUT,
                fmt::format("torque_delta_nm[{}] is not finite: {}", i, result.delta(i)));
        }
    }

    const auto t_end = std::chrono::steady_clock::now();
    const double runtime_ms =
        std::chrono::duration<double, std::milli>(t_end - t_start).count();

    std::vector<std::string> warnings = result.warnings;
    warnings.insert(warnings.end(),
                    std::get<validation::Accepted>(outcome).warnings.begin(),
                    std::get<validation::Accepted>(outcome).warnings.end());
    result.warnings = dedupe(std::move(warnings));

    auto response = contract::make_ok_response(
        request.request_id, result, runtime_ms,
        {config_.version_note,
         fmt::format("Optimization completed in {} cycles", result.cycles_used)});

    log::info(COMPONENT, "request {} complete: status=ok runtime_ms={:.2f} peak_gain={:.4f}",
              request.request_id, runtime_ms, result.estimated_peak_gain_ratio);
    return response;
}

// ─── Runner::respond ──────────────────────────────────────────────────────────

contract::Response Runner::respond(std::string_view request_text) const {
    if (is_blank(request_text)) {
        log::error(COMPONENT, "stdin was empty");
        return contract::make_error_response("unknown", contract::codes::EMPTY_INPUT,
                                             "stdin was empty");
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(request_text);
    } catch (const nlohmann::json::parse_error& e) {
        log::error(COMPONENT, "failed to parse JSON request: {}", e.what());
        return contract::make_error_response("unknown", contract::codes::JSON_PARSE_ERROR,
                                             e.what());
    }

    const std::string request_id = contract::request_id_of(doc);

    try {
        auto parsed = contract::parse_request(doc);
        if (auto* err = std::get_if<contract::ContractError>(&parsed)) {
            log::warn(COMPONENT, "request schema validation failed: {}", err->message);
            return contract::make_error_response(request_id, err->code,
                                                 std::move(err->message));
        }

        auto response = process(std::get<contract::Request>(parsed));

        const auto problems = contract::validate_response(response);
        if (!problems.empty()) {
            const std::string joined = fmt::format("{}", fmt::join(problems, "; "));
            log::error(COMPONENT, "response self-check failed: {}", joined);
            return contract::make_error_response(
                request_id, contract::codes::INTERNAL_VALIDATION, joined);
        }
        return response;
    } catch (const std::exception& e) {
        log::error(COMPONENT, "unhandled error while processing {}: {}", request_id, e.what());
        return contract::make_error_response(request_id, contract::codes::UNHANDLED_ERROR,
                                             e.what());
    }
}

// ─── Runner::handle ───────────────────────────────────────────────────────────

std::string Runner::handle(std::string_view request_text) const {
    // Error messages can echo raw input bytes; invalid UTF-8 is replaced, not thrown.
    return contract::to_json(respond(request_text))
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace ecutune::core

/// @file src/contract/response.cpp
/// @brief Response envelope construction, self-check and serialisation.

#include "ecutune/contract.hpp"
#include "ecutune/constants.hpp"

#include <fmt/format.h>

#include <cmath>
#include <utility>

namespace ecutune::contract {

using nlohmann::json;

// ─── Helpers ──────────────────────────────────────────────────────────────────

std::string_view to_string(Status status) noexcept {
    switch (status) {
        case Status::Ok:       return "ok";
        case Status::Rejected: return "rejected";
        case Status::Error:    return "error";
    }
    return "error";
}

double round_to(double value, int decimals) noexcept {
    if (!std::isfinite(value)) {
        return value;
    }
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

// ─── Builders ─────────────────────────────────────────────────────────────────

Response make_ok_response(std::string request_id,
                          const search::SearchResult& result,
                          double runtime_ms,
                          std::vector<std::string> notes) {
    Proposal proposal{
        .calibration               = result.calibration,
        .torque_delta_nm           = std::vector<double>(result.delta.data(),
                                                         result.delta.data() + result.delta.size()),
        .confidence                = result.confidence,
        .estimated_peak_gain_ratio = result.estimated_peak_gain_ratio,
    };

    Response r;
    r.request_id = std::move(request_id);
    r.status     = Status::Ok;
    r.proposal   = std::move(proposal);
    r.metrics    = RunMetrics{
        .cycles_used = result.cycles_used,
        .runtime_ms  = runtime_ms,
        .best_score  = result.best_score,
    };
    r.notes    = std::move(notes);
    r.warnings = result.warnings;
    return r;
}

Response make_rejected_response(std::string request_id,
                                std::vector<std::string> warnings,
                                std::vector<std::string> notes) {
    Response r;
    r.request_id = std::move(request_id);
    r.status     = Status::Rejected;
    r.notes      = std::move(notes);
    r.warnings   = std::move(warnings);
    return r;
}

Response make_error_response(std::string request_id,
                             std::string_view code,
                             std::string message) {
    Response r;
    r.request_id = std::move(request_id);
    r.status     = Status::Error;
    r.error      = ContractError{std::string(code), std::move(message)};
    return r;
}

// ─── validate_response ────────────────────────────────────────────────────────

std::vector<std::string> validate_response(const Response& response) {
    std::vector<std::string> errors;

    switch (response.status) {
        case Status::Ok:
            if (!response.proposal) {
                errors.emplace_back("status=ok but proposal is missing");
                break;
            }
            if (!response.metrics) {
                errors.emplace_back("status=ok but metrics are missing");
            }
            for (std::size_t i = 0; i < response.proposal->torque_delta_nm.size(); ++i) {
                const double d = response.proposal->torque_delta_nm[i];
                if (!std::isfinite(d)) {
                    errors.push_back(fmt::format("Non-finite delta at index {}: {}", i, d));
                    break;
                }
            }
            break;
        case Status::Rejected:
            if (response.proposal) {
                errors.emplace_back("status=rejected but a proposal is attached");
            }
            break;
        case Status::Error:
            if (!response.error) {
                errors.emplace_back("status=error but error details are missing");
            }
            break;
    }

    return errors;
}

// ─── to_json ──────────────────────────────────────────────────────────────────

json to_json(const Response& response) {
    json out = {
        {"contract_version", std::string(constants::CONTRACT_VERSION)},
        {"request_id",       response.request_id},
        {"status",           std::string(to_string(response.status))},
        {"proposal",         nullptr},
        {"metrics",          nullptr},
        {"debug",            {{"notes", response.notes}, {"warnings", response.warnings}}},
        {"error",            nullptr},
    };

    if (response.proposal) {
        const Proposal& p = *response.proposal;
        json calibration = json::object();
        for (const auto param : ALL_CALIBRATION_PARAMS) {
            calibration[std::string(ecutune::to_string(param))] = p.calibration[param];
        }
        out["proposal"] = {
            {"calibration",     std::move(calibration)},
            {"torque_delta_nm", p.torque_delta_nm},
            {"confidence",      round_to(p.confidence, constants::CONFIDENCE_DECIMALS)},
            {"estimated_peak_gain_ratio",
             round_to(p.estimated_peak_gain_ratio, constants::PEAK_GAIN_DECIMALS)},
        };
    }

    if (response.metrics) {
        const RunMetrics& m = *response.metrics;
        out["metrics"] = {
            {"cycles_used", m.cycles_used},
            {"runtime_ms",  round_to(m.runtime_ms, constants::RUNTIME_MS_DECIMALS)},
            {"best_score",  round_to(m.best_score, constants::BEST_SCORE_DECIMALS)},
        };
    }

    if (response.error) {
        out["error"] = {
            {"code",    response.error->code},
            {"message", response.error->message},
        };
    }

    return out;
}

} // namespace ecutune::contract

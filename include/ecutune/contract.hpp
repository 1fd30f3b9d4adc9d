#pragma once

/// @file include/ecutune/contract.hpp
/// @brief Versioned JSON request/response contract for the ecutune runner.
///
/// # Module: Contract
///
/// ## Responsibility
/// Convert a JSON request into validated core inputs, and a search outcome
/// into the JSON response envelope. This is the only module that knows the
/// wire format.
///
/// ## Request (contract_version "1.0")
/// ```
/// { "contract_version": "1.0", "request_id": "r-1", "seed": 777,
///   "cycle_budget": 20,
///   "baseline_curve": { "rpm_bins": [1000, ...], "torque_nm": [200.0, ...] },
///   "constraints": { "max_peak_gain_ratio": 0.02, "max_bin_delta_nm": 8.0,
///                    "max_bin_delta_ratio": 0.03,
///                    "smoothness": { "max_second_derivative": 0.15 },
///                    "calibration_ranges": { "afr_target": [11.5, 14.7] } } }
/// ```
/// Other top-level keys (vehicle, environment, parts, ...) are ignored.
///
/// ## Response
/// ```
/// { "contract_version": "1.0", "request_id": "r-1", "status": "ok",
///   "proposal": { "calibration": {...}, "torque_delta_nm": [...],
///                 "confidence": 0.73, "estimated_peak_gain_ratio": 0.0146 },
///   "metrics":  { "cycles_used": 20, "runtime_ms": 0.12, "best_score": 1051.3 },
///   "debug":    { "notes": [...], "warnings": [...] },
///   "error":    null }
/// ```
///
/// ## Guarantees
/// - `parse_request` never throws for any JSON value; all problems become a
///   `ContractError`
/// - Every response carries the contract version and echoes the request id

#include "ecutune/search.hpp"
#include "ecutune/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ecutune::contract {

// ─── Error Codes ──────────────────────────────────────────────────────────────

namespace codes {
inline constexpr std::string_view EMPTY_INPUT          = "EMPTY_INPUT";
inline constexpr std::string_view JSON_PARSE_ERROR     = "JSON_PARSE_ERROR";
inline constexpr std::string_view INVALID_REQUEST_TYPE = "INVALID_REQUEST_TYPE";
inline constexpr std::string_view SCHEMA_ERROR         = "SCHEMA_ERROR";
inline constexpr std::string_view OPTIMIZER_ERROR      = "OPTIMIZER_ERROR";
inline constexpr std::string_view NON_FINITE_OUTPUT    = "NON_FINITE_OUTPUT";
inline constexpr std::string_view INTERNAL_VALIDATION  = "INTERNAL_VALIDATION";
inline constexpr std::string_view UNHANDLED_ERROR      = "UNHANDLED_ERROR";
} // namespace codes

/// A contract-level failure: machine code plus human message.
struct ContractError {
    std::string code;
    std::string message;
};

// ─── Request ──────────────────────────────────────────────────────────────────

/// A schema-validated optimization request.
struct Request {
    std::string   request_id;
    std::int64_t  seed = 0;
    std::size_t   cycle_budget = 0;
    BaselineCurve baseline;
    Constraints   constraints;
};

using ParseOutcome = std::variant<Request, ContractError>;

/// Validate and convert a parsed JSON document.
///
/// Any schema violation yields `ContractError{SCHEMA_ERROR, ...}`; a
/// non-object document yields `INVALID_REQUEST_TYPE`.
[[nodiscard]] ParseOutcome parse_request(const nlohmann::json& doc);

/// Parse just the `constraints` object. Missing scalar limits take their
/// defaults; unknown calibration parameter names are skipped.
[[nodiscard]] std::variant<Constraints, ContractError>
parse_constraints(const nlohmann::json& obj);

/// `request_id` if present and a string, else `"unknown"`.
[[nodiscard]] std::string request_id_of(const nlohmann::json& doc);

// ─── Response ─────────────────────────────────────────────────────────────────

enum class Status { Ok, Rejected, Error };

[[nodiscard]] std::string_view to_string(Status status) noexcept;

/// Proposed change, as reported to the caller.
struct Proposal {
    Calibration         calibration;
    std::vector<double> torque_delta_nm;
    double              confidence = 0.0;
    double              estimated_peak_gain_ratio = 0.0;
};

/// Run metrics for an `ok` response.
struct RunMetrics {
    std::size_t cycles_used = 0;
    double      runtime_ms  = 0.0;
    double      best_score  = 0.0;
};

/// The full response envelope.
struct Response {
    std::string                  request_id = "unknown";
    Status                       status     = Status::Error;
    std::optional<Proposal>      proposal;
    std::optional<RunMetrics>    metrics;
    std::vector<std::string>     notes;
    std::vector<std::string>     warnings;
    std::optional<ContractError> error;
};

/// `ok` response built from a search result.
[[nodiscard]] Response make_ok_response(std::string request_id,
                                        const search::SearchResult& result,
                                        double runtime_ms,
                                        std::vector<std::string> notes);

/// `rejected` response: the proposal failed final self-validation.
[[nodiscard]] Response make_rejected_response(std::string request_id,
                                              std::vector<std::string> warnings,
                                              std::vector<std::string> notes);

/// `error` response.
[[nodiscard]] Response make_error_response(std::string request_id,
                                           std::string_view code,
                                           std::string message);

/// Self-check before serialising. Returns the problems found (empty = valid).
[[nodiscard]] std::vector<std::string> validate_response(const Response& response);

/// Serialise the envelope. Rounds confidence, peak gain, best score and
/// runtime to their reported precision.
[[nodiscard]] nlohmann::json to_json(const Response& response);

/// Round half away from zero to `decimals` places. Non-finite values pass through.
[[nodiscard]] double round_to(double value, int decimals) noexcept;

} // namespace ecutune::contract

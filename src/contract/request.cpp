/// @file src/contract/request.cpp
/// @brief JSON request parsing and schema validation.

#include "ecutune/contract.hpp"
#include "ecutune/constants.hpp"
#include "ecutune/log.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

namespace ecutune::contract {

namespace {

using nlohmann::json;

ContractError schema_error(std::string message) {
    return ContractError{std::string(codes::SCHEMA_ERROR), std::move(message)};
}

/// Look up a required key. Returns nullptr if it is missing.
const json* find_key(const json& obj, std::string_view key) {
    const auto it = obj.find(std::string(key));
    return it == obj.end() ? nullptr : &*it;
}

std::string missing_field(std::string_view key, std::string_view context) {
    return fmt::format("Missing required field '{}' in {}", key, context);
}

/// Read an optional non-negative finite limit, keeping `out` when absent.
std::optional<ContractError>
read_limit(const json& obj, std::string_view key, std::string_view context, double& out) {
    const json* v = find_key(obj, key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (!v->is_number()) {
        return schema_error(fmt::format("{}.{} must be a number", context, key));
    }
    const double d = v->get<double>();
    if (!std::isfinite(d) || d < 0.0) {
        return schema_error(fmt::format(
            "{}.{}={} must be finite and non-negative", context, key, d));
    }
    out = d;
    return std::nullopt;
}

} // anonymous namespace

// ─── request_id_of ────────────────────────────────────────────────────────────

std::string request_id_of(const json& doc) {
    if (doc.is_object()) {
        const auto it = doc.find("request_id");
        if (it != doc.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "unknown";
}

// ─── parse_constraints ────────────────────────────────────────────────────────

std::variant<Constraints, ContractError> parse_constraints(const json& obj) {
    if (!obj.is_object()) {
        return schema_error("constraints must be an object");
    }

    Constraints c;
    if (auto e = read_limit(obj, "max_peak_gain_ratio", "constraints", c.max_peak_gain_ratio)) {
        return *e;
    }
    if (auto e = read_limit(obj, "max_bin_delta_nm", "constraints", c.max_bin_delta_nm)) {
        return *e;
    }
    if (auto e = read_limit(obj, "max_bin_delta_ratio", "constraints", c.max_bin_delta_ratio)) {
        return *e;
    }

    if (const json* smooth = find_key(obj, "smoothness")) {
        if (!smooth->is_object()) {
            return schema_error("constraints.smoothness must be an object");
        }
        if (auto e = read_limit(*smooth, "max_second_derivative", "constraints.smoothness",
                                c.smoothness.max_second_derivative)) {
            return *e;
        }
    }

    if (const json* ranges = find_key(obj, "calibration_ranges")) {
        if (!ranges->is_object()) {
            return schema_error("constraints.calibration_ranges must be an object");
        }
        for (const auto& [name, range] : ranges->items()) {
            if (!range.is_array() || range.size() != 2 ||
                !range[0].is_number() || !range[1].is_number()) {
                return schema_error(fmt::format(
                    "calibration_ranges.{} must be a [lo, hi] pair of numbers", name));
            }
            const double lo = range[0].get<double>();
            const double hi = range[1].get<double>();
            if (!std::isfinite(lo) || !std::isfinite(hi) || lo > hi) {
                return schema_error(fmt::format(
                    "calibration_ranges.{}=[{}, {}] must be finite with lo <= hi",
                    name, lo, hi));
            }
            const auto param = parse_calibration_param(name);
            if (!param) {
                log::warn("contract", "ignoring unknown calibration parameter '{}'", name);
                continue;
            }
            c.calibration_ranges[*param] = CalibrationRange{lo, hi};
        }
    }

    return c;
}

// ─── parse_request ────────────────────────────────────────────────────────────

ParseOutcome parse_request(const json& doc) {
    if (!doc.is_object()) {
        return ContractError{std::string(codes::INVALID_REQUEST_TYPE),
                             "Request must be a JSON object"};
    }

    // ── Envelope ──────────────────────────────────────────────────────────────
    const json* version = find_key(doc, "contract_version");
    if (version == nullptr) {
        return schema_error(missing_field("contract_version", "request"));
    }
    if (!version->is_string() || version->get<std::string>() != constants::CONTRACT_VERSION) {
        return schema_error(fmt::format("Unsupported contract_version '{}'. Expected '{}'",
                                        version->is_string() ? version->get<std::string>()
                                                             : version->dump(),
                                        constants::CONTRACT_VERSION));
    }

    for (const std::string_view key :
         {"request_id", "seed", "cycle_budget", "baseline_curve", "constraints"}) {
        if (find_key(doc, key) == nullptr) {
            return schema_error(missing_field(key, "request"));
        }
    }

    if (!doc["request_id"].is_string()) {
        return schema_error("request_id must be a string");
    }

    Request req;
    req.request_id = request_id_of(doc);

    // ── Seed / budget ─────────────────────────────────────────────────────────
    const json& seed = doc["seed"];
    if (!seed.is_number_integer() ||
        (seed.is_number_unsigned() &&
         seed.get<std::uint64_t>() >
             static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))) {
        return schema_error(fmt::format("seed must be an integer, got {}", seed.dump()));
    }
    req.seed = seed.get<std::int64_t>();

    const json& budget = doc["cycle_budget"];
    if (!budget.is_number_integer() ||
        (!budget.is_number_unsigned() && budget.get<std::int64_t>() < 1) ||
        (budget.is_number_unsigned() && budget.get<std::uint64_t>() < 1)) {
        return schema_error(fmt::format(
            "cycle_budget must be a positive integer, got {}", budget.dump()));
    }
    req.cycle_budget = budget.is_number_unsigned()
                           ? static_cast<std::size_t>(budget.get<std::uint64_t>())
                           : static_cast<std::size_t>(budget.get<std::int64_t>());

    // ── Baseline curve ────────────────────────────────────────────────────────
    const json& curve = doc["baseline_curve"];
    if (!curve.is_object()) {
        return schema_error("baseline_curve must be an object");
    }
    const json* rpm = find_key(curve, "rpm_bins");
    if (rpm == nullptr) {
        return schema_error(missing_field("rpm_bins", "baseline_curve"));
    }
    const json* torque = find_key(curve, "torque_nm");
    if (torque == nullptr) {
        return schema_error(missing_field("torque_nm", "baseline_curve"));
    }
    if (!rpm->is_array() || rpm->empty()) {
        return schema_error("baseline_curve.rpm_bins must be a non-empty list");
    }
    if (!torque->is_array() || torque->empty()) {
        return schema_error("baseline_curve.torque_nm must be a non-empty list");
    }
    if (rpm->size() != torque->size()) {
        return schema_error(fmt::format("rpm_bins length {} != torque_nm length {}",
                                        rpm->size(), torque->size()));
    }

    std::vector<int> rpm_bins;
    rpm_bins.reserve(rpm->size());
    for (std::size_t i = 0; i < rpm->size(); ++i) {
        const json& r = (*rpm)[i];
        if (!r.is_number_integer()) {
            return schema_error(fmt::format(
                "baseline_curve.rpm_bins[{}]={} must be an integer", i, r.dump()));
        }
        const bool in_range =
            r.is_number_unsigned()
                ? r.get<std::uint64_t>() <=
                      static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                : r.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                      r.get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!in_range) {
            return schema_error(fmt::format(
                "baseline_curve.rpm_bins[{}]={} is out of range", i, r.dump()));
        }
        rpm_bins.push_back(static_cast<int>(r.get<std::int64_t>()));
        if (i > 0 && rpm_bins[i] <= rpm_bins[i - 1]) {
            return schema_error(fmt::format(
                "rpm_bins must be monotonically ascending: "
                "rpm_bins[{}]={} >= rpm_bins[{}]={}",
                i - 1, rpm_bins[i - 1], i, rpm_bins[i]));
        }
    }

    std::vector<double> torque_nm;
    torque_nm.reserve(torque->size());
    for (std::size_t i = 0; i < torque->size(); ++i) {
        const json& t = (*torque)[i];
        const double v = t.is_number() ? t.get<double>()
                                       : std::numeric_limits<double>::quiet_NaN();
        if (!std::isfinite(v) || v <= 0.0) {
            return schema_error(fmt::format(
                "baseline_curve.torque_nm[{}]={} must be finite and positive", i, t.dump()));
        }
        torque_nm.push_back(v);
    }

    auto baseline = BaselineCurve::make(std::move(rpm_bins), torque_nm);
    if (!baseline) {
        return schema_error("baseline_curve is not a valid curve");
    }
    req.baseline = std::move(*baseline);

    // ── Constraints ───────────────────────────────────────────────────────────
    auto constraints = parse_constraints(doc["constraints"]);
    if (auto* err = std::get_if<ContractError>(&constraints)) {
        return *err;
    }
    req.constraints = std::get<Constraints>(std::move(constraints));

    return req;
}

} // namespace ecutune::contract

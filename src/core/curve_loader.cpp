/// @file src/core/curve_loader.cpp
/// @brief CSV CurveLoader for baseline torque curves.

#include "ecutune/curve_loader.hpp"
#include "ecutune/log.hpp"

#include <charconv>
#include <cmath>
#include <exception>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace ecutune::core {

namespace {

std::string trim(const std::string& token) {
    const auto first = token.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = token.find_last_not_of(" \t\r\n");
    return token.substr(first, last - first + 1);
}

} // anonymous namespace

// ─── CurveLoader::parse_row ───────────────────────────────────────────────────

std::optional<std::pair<int, double>>
CurveLoader::parse_row(const std::string& line) noexcept {
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    try {
        const auto comma = line.find(',');
        if (comma == std::string::npos || line.find(',', comma + 1) != std::string::npos) {
            return std::nullopt;
        }

        const std::string rpm_tok    = trim(line.substr(0, comma));
        const std::string torque_tok = trim(line.substr(comma + 1));
        if (rpm_tok.empty() || torque_tok.empty()) {
            return std::nullopt;
        }

        int rpm = 0;
        const auto [ptr, ec] =
            std::from_chars(rpm_tok.data(), rpm_tok.data() + rpm_tok.size(), rpm);
        if (ec != std::errc{} || ptr != rpm_tok.data() + rpm_tok.size()) {
            return std::nullopt;
        }

        std::size_t pos = 0;
        const double torque = std::stod(torque_tok, &pos);
        if (pos != torque_tok.size() || !std::isfinite(torque)) {
            return std::nullopt;
        }

        return std::make_pair(rpm, torque);
    } catch (const std::exception&) {
        // std::stod rejected the token.
        return std::nullopt;
    }
}

// ─── CurveLoader::parse_csv_string ────────────────────────────────────────────

std::optional<BaselineCurve>
CurveLoader::parse_csv_string(const std::string& csv_content) noexcept {
    try {
        std::vector<int>    rpm_bins;
        std::vector<double> torque;
        std::istringstream  stream(csv_content);
        std::string         line;
        bool                header_skipped = false;
        std::size_t         line_no = 0;

        while (std::getline(stream, line)) {
            ++line_no;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (trim(line).empty() || line[0] == '#') {
                continue;
            }
            if (!header_skipped) {
                header_skipped = true;
                continue;
            }

            const auto row = parse_row(line);
            if (!row) {
                log::warn("curve_loader", "skipping malformed row {}: '{}'", line_no, line);
                continue;
            }
            rpm_bins.push_back(row->first);
            torque.push_back(row->second);
        }

        auto curve = BaselineCurve::make(std::move(rpm_bins), torque);
        if (!curve) {
            log::error("curve_loader",
                       "rows do not form a valid curve (need ascending rpm and positive torque)");
        }
        return curve;
    } catch (const std::exception& e) {
        log::error("curve_loader", "failed to parse curve: {}", e.what());
        return std::nullopt;
    }
}

// ─── CurveLoader::load_csv ────────────────────────────────────────────────────

std::optional<BaselineCurve>
CurveLoader::load_csv(const std::string& filepath) noexcept {
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            log::error("curve_loader", "cannot open file '{}'", filepath);
            return std::nullopt;
        }

        std::ostringstream contents;
        contents << file.rdbuf();
        return parse_csv_string(contents.str());
    } catch (const std::exception& e) {
        log::error("curve_loader", "failed to read '{}': {}", filepath, e.what());
        return std::nullopt;
    }
}

}  // namespace ecutune::core

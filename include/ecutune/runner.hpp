#pragma once

/// @file include/ecutune/runner.hpp
/// @brief Runner: one request in, one response out.
///
/// # Module: Runner
///
/// ## Responsibility
/// Process exactly one JSON request text end to end:
///   text → JSON → Request → SearchLoop → final self-validation →
///   Response envelope → JSON text
///
/// ## Usage
/// ```cpp
/// ecutune::core::Runner runner;
/// const std::string request = read_all(std::cin);
/// std::cout << runner.handle(request) << '\n';
/// ```
///
/// ## Guarantees
/// - Always produces exactly one response, whatever the input
/// - Writes nothing to stdout itself; diagnostics go to the stderr logger
/// - The runner is the only place errors are caught and turned into
///   `error` responses

#include "ecutune/contract.hpp"
#include "ecutune/search.hpp"

#include <string>
#include <string_view>

namespace ecutune::core {

// ─── RunnerConfig ─────────────────────────────────────────────────────────────

/// Configuration for the runner.
struct RunnerConfig {
    /// Forwarded to every SearchLoop run.
    search::SearchConfig search{};

    /// Leading note attached to `ok` responses.
    std::string version_note = "ecutune v1.0";
};

// ─── Runner ───────────────────────────────────────────────────────────────────

/// Processes single optimization requests.
class Runner {
public:
    explicit Runner(RunnerConfig config = RunnerConfig{});

    /// Handle one request text and return the serialised response.
    [[nodiscard]] std::string handle(std::string_view request_text) const;

    /// Handle one request text and return the response envelope.
    [[nodiscard]] contract::Response respond(std::string_view request_text) const;

    /// Process an already-validated request.
    [[nodiscard]] contract::Response process(const contract::Request& request) const;

    /// Exit status for a response: 0 unless `status` is `error`.
    [[nodiscard]] static int exit_code(const contract::Response& response) noexcept;

private:
    RunnerConfig config_;
};

} // namespace ecutune::core

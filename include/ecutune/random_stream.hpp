#pragma once

/// @file include/ecutune/random_stream.hpp
/// @brief RandomStream: the single source of variation in a search run.
///
/// # Module: Random Stream
///
/// ## Responsibility
/// Produce a reproducible sequence of uniform reals from one integer seed.
/// Every sampling call in the optimizer receives a `RandomStream&`
/// explicitly; there is no global generator.
///
/// ## Reproducibility
/// The engine is `std::mt19937_64`, whose output sequence is fixed by the
/// C++ standard. The standard distributions are avoided because their
/// output is implementation-defined; instead the top 53 bits of each draw
/// are mapped onto [0, 1):
/// ```
/// u = (x >> 11) · 2⁻⁵³
/// uniform(lo, hi) = lo + (hi − lo) · u
/// ```
/// so the same seed replays the same samples on every conforming toolchain.
///
/// ## NOT Responsible For
/// - Deciding the order of draws (see SearchLoop)

#include <cstdint>
#include <random>

namespace ecutune {

/// Deterministic seeded uniform-real generator.
class RandomStream {
public:
    /// Seed the stream. Negative seeds are reinterpreted bit-for-bit.
    explicit RandomStream(std::int64_t seed) noexcept;

    /// Uniform real in [0, 1).
    [[nodiscard]] double next_unit() noexcept;

    /// Uniform real between `lo` and `hi`.
    ///
    /// Accepts `lo > hi`; the result then lies in (hi, lo]. Returns `lo`
    /// exactly when `lo == hi`.
    [[nodiscard]] double uniform(double lo, double hi) noexcept;

    /// Number of values drawn since construction.
    [[nodiscard]] std::uint64_t draws() const noexcept { return draws_; }

    /// Seed the stream was constructed with.
    [[nodiscard]] std::int64_t seed() const noexcept { return seed_; }

private:
    std::mt19937_64 engine_;
    std::int64_t    seed_;
    std::uint64_t   draws_ = 0;
};

} // namespace ecutune

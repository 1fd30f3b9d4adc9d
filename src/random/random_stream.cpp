/// @file src/random/random_stream.cpp
/// @brief RandomStream implementation.

#include "ecutune/random_stream.hpp"

namespace ecutune {

namespace {

/// 2⁻⁵³: spacing of doubles in [0.5, 1).
constexpr double UNIT_SCALE = 1.0 / 9007199254740992.0;

} // anonymous namespace

RandomStream::RandomStream(std::int64_t seed) noexcept
    : engine_(static_cast<std::uint64_t>(seed))
    , seed_(seed)
{}

double RandomStream::next_unit() noexcept {
    ++draws_;
    return static_cast<double>(engine_() >> 11) * UNIT_SCALE;
}

double RandomStream::uniform(double lo, double hi) noexcept {
    return lo + (hi - lo) * next_unit();
}

} // namespace ecutune

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>


namespace lightsync::core::transport::connection {

// -----------------------------------------------------------------------------
// Full-jitter exponential backoff
// -----------------------------------------------------------------------------
//
//   ceiling(attempt) = min(base * 2^(attempt-1), max)
//   delay(attempt)   = uniform(0, ceiling(attempt))
//
// attempt is 1-based. The exponent is clamped so the shift never overflows.
//
[[nodiscard]]
inline std::chrono::milliseconds backoff_ceiling(std::uint32_t attempt,
                                                 std::chrono::milliseconds base,
                                                 std::chrono::milliseconds max) noexcept {
    if (attempt == 0) {
        attempt = 1;
    }
    const std::uint32_t exponent = std::min<std::uint32_t>(attempt - 1, 30);
    const std::int64_t b = std::max<std::int64_t>(base.count(), 0);
    const std::int64_t m = std::max<std::int64_t>(max.count(), 0);
    // b * 2^exponent, saturating at m
    if (b != 0 && exponent > 0 && b > (m >> exponent)) {
        return std::chrono::milliseconds(m);
    }
    return std::chrono::milliseconds(std::min<std::int64_t>(b << exponent, m));
}

template<class Rng>
[[nodiscard]]
inline std::chrono::milliseconds full_jitter(std::uint32_t attempt,
                                             std::chrono::milliseconds base,
                                             std::chrono::milliseconds max,
                                             Rng& rng) {
    const auto ceiling = backoff_ceiling(attempt, base, max);
    std::uniform_int_distribution<std::int64_t> dist(0, ceiling.count());
    return std::chrono::milliseconds(dist(rng));
}

} // namespace lightsync::core::transport::connection

#pragma once

#include <cstdint>
#include <string_view>


namespace lightsync::core::state {

enum class ApplyStatus : std::uint8_t {
    Ok,             // state mutated
    SequenceGap,    // delta rejected, state untouched
    Ignored         // nothing applicable (unknown key, no snapshot yet)
};

[[nodiscard]]
inline constexpr std::string_view to_string(ApplyStatus s) noexcept {
    switch (s) {
    case ApplyStatus::Ok:          return "Ok";
    case ApplyStatus::SequenceGap: return "SequenceGap";
    case ApplyStatus::Ignored:     return "Ignored";
    }
    return "Unknown";
}

// Outcome of applying one message to a store.
// expected / received are only meaningful for SequenceGap.
struct ApplyResult {
    ApplyStatus status{ApplyStatus::Ok};
    std::uint64_t expected{0};
    std::uint64_t received{0};

    [[nodiscard]]
    inline bool ok() const noexcept { return status == ApplyStatus::Ok; }

    [[nodiscard]]
    inline bool is_gap() const noexcept { return status == ApplyStatus::SequenceGap; }

    static constexpr ApplyResult applied() noexcept { return ApplyResult{}; }

    static constexpr ApplyResult ignored() noexcept {
        return ApplyResult{ApplyStatus::Ignored, 0, 0};
    }

    static constexpr ApplyResult gap(std::uint64_t expected, std::uint64_t received) noexcept {
        return ApplyResult{ApplyStatus::SequenceGap, expected, received};
    }
};

} // namespace lightsync::core::state

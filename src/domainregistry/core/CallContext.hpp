#pragma once
#include "core/Principal.hpp"

#include <chrono>
#include <cstdint>

namespace DR {

// Nanoseconds since the Unix epoch.
using Timestamp = std::uint64_t;
// Nanoseconds.
using Duration = std::uint64_t;

inline constexpr Duration NanosPerSecond = 1'000'000'000ULL;

/**
 * @brief The execution environment's view of a single call.
 *
 * Registry operations never read the clock or the caller implicitly; both are
 * passed in so transitions can be replayed with synthetic callers and clocks.
 */
struct CallContext {
    Principal caller = Principal::anonymous();
    Timestamp now = 0;
};

[[nodiscard]] inline auto toTimestamp(std::chrono::system_clock::time_point tp) -> Timestamp {
    auto const ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
    return ns.count() < 0 ? 0 : static_cast<Timestamp>(ns.count());
}

[[nodiscard]] inline auto systemCallContext(Principal caller) -> CallContext {
    return CallContext{.caller = std::move(caller), .now = toTimestamp(std::chrono::system_clock::now())};
}

} // namespace DR

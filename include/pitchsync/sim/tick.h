#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace pitchsync::sim {

using Tick = std::uint32_t;

inline constexpr Tick kInvalidTick = std::numeric_limits<Tick>::max();

inline constexpr std::size_t kDefaultTickBufferCapacity = 1024;

inline bool IsSendTick(Tick tick, int interval_ticks) {
    return interval_ticks <= 1 || tick % static_cast<Tick>(interval_ticks) == 0;
}

}  // namespace pitchsync::sim

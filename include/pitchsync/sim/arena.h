#pragma once

#include "core/math.h"

namespace pitchsync::sim {

// Axis-aligned pitch centred on the origin, floor at y = 0, goals at +-z.
struct ArenaSettings final {
    float half_width = 30.0F;
    float half_length = 45.0F;
    float ceiling_height = 20.0F;
    float goal_half_width = 6.0F;
    float goal_height = 6.0F;
    float goal_depth = 4.0F;
    core::Vec3 ball_spawn{.x = 0.0F, .y = 1.0F, .z = 0.0F};
    core::Vec3 player_one_spawn{.x = 0.0F, .y = 0.35F, .z = -20.0F};
    core::Vec3 player_two_spawn{.x = 0.0F, .y = 0.35F, .z = 20.0F};
};

const ArenaSettings& DefaultArenaSettings();

}  // namespace pitchsync::sim

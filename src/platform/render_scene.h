#pragma once

#include <cstdint>
#include <vector>

namespace pitchsync::platform {

enum class RenderCarKind : std::uint8_t {
    Local = 0,
    LocalServerGhost = 1,
    Remote = 2,
};

// Top-down view: x is screen right, z is screen up.
struct RenderCar final {
    RenderCarKind kind = RenderCarKind::Remote;
    std::uint8_t player_slot = 0;
    float x = 0.0F;
    float z = 0.0F;
    float height = 0.0F;
    float heading_x = 0.0F;
    float heading_z = 1.0F;
};

struct RenderBall final {
    bool visible = false;
    bool extrapolating = false;
    float x = 0.0F;
    float z = 0.0F;
    float height = 0.0F;
};

struct RenderHudState final {
    bool connected = false;
    std::uint8_t match_phase = 0;
    std::uint16_t score_player_one = 0;
    std::uint16_t score_player_two = 0;
    float remaining_seconds = 0.0F;
    float match_duration_seconds = 180.0F;
    bool show_debug_overlay = false;
    std::uint32_t blended_correction_count = 0;
    std::uint32_t snapped_correction_count = 0;
    float last_position_error = 0.0F;
    float rtt_seconds = 0.0F;
};

struct RenderScene final {
    float arena_half_width = 30.0F;
    float arena_half_length = 45.0F;
    float goal_half_width = 6.0F;
    std::vector<RenderCar> cars;
    RenderBall ball{};
    RenderHudState hud{};
};

}  // namespace pitchsync::platform

#pragma once

#include "core/math.h"
#include "sim/tick.h"

#include <cstdint>

namespace pitchsync::sim {

enum class CarSurfaceState : std::uint8_t {
    AllWheelsGround = 0,
    Air = 1,
    AllWheelsSurface = 2,
    SomeWheelsSurface = 3,
    BodySideGround = 4,
    BodyGroundDead = 5,
};

inline constexpr std::uint8_t kCarSurfaceStateCount = 6;

const char* CarSurfaceStateName(CarSurfaceState state);

inline constexpr float kDefaultWheelSideFriction = 8.0F;

// Everything a car step reads back on the next tick. Restoring this value is
// enough to replay the car from any buffered tick.
struct CarState final {
    Tick tick = kInvalidTick;
    core::Vec3 position{};
    core::Quat rotation{};
    core::Vec3 linear_velocity{};
    core::Vec3 angular_velocity{};
    bool can_drive = false;
    bool all_wheels_on_surface = false;
    std::uint8_t wheels_on_surface_count = 0;
    bool body_on_surface = false;
    float forward_speed = 0.0F;
    float forward_speed_sign = 1.0F;
    float forward_speed_abs = 0.0F;
    CarSurfaceState surface_state = CarSurfaceState::Air;
    bool jumping = false;
    bool can_first_jump = false;
    bool can_keep_jumping = false;
    float jump_timer = 0.0F;
    float wheel_side_friction = kDefaultWheelSideFriction;
};

struct BallState final {
    Tick tick = kInvalidTick;
    core::Vec3 position{};
    core::Quat rotation{};
    core::Vec3 linear_velocity{};
    core::Vec3 angular_velocity{};
};

// Reduced car state broadcast to clients that do not own the car.
struct RemoteCarSnapshot final {
    Tick tick = kInvalidTick;
    core::Vec3 position{};
    core::Quat rotation{};
    core::Vec3 linear_velocity{};
};

RemoteCarSnapshot MakeRemoteSnapshot(const CarState& state);

CarState MakeSpawnedCarState(Tick tick, const core::Vec3& position, const core::Quat& rotation);

struct RenderTransform final {
    core::Vec3 position{};
    core::Quat rotation{};
};

}  // namespace pitchsync::sim

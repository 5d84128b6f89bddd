#pragma once

#include "sim/arena.h"
#include "sim/entity_state.h"

#include <cstdint>

namespace pitchsync::sim {

enum class GoalSide : std::uint8_t {
    None = 0,
    PositiveZ = 1,
    NegativeZ = 2,
};

struct BallStepEvents final {
    bool bounced = false;
    GoalSide goal = GoalSide::None;
};

struct BallSettings final {
    float radius = 0.9F;
    float mass = 1.0F;
    float gravity = 9.81F;
    float floor_restitution = 0.6F;
    float wall_restitution = 0.6F;
    float rolling_damping = 0.3F;
    float max_speed = 60.0F;
    float hit_base_force = 400.0F;
    float hit_speed_multiplier = 50.0F;
    float hit_full_blend_speed = 20.0F;
    float hit_min_direction_speed = 1.0F;
    float car_contact_radius = 0.9F;
};

const BallSettings& DefaultBallSettings();

class BallPhysics final {
public:
    BallPhysics();
    BallPhysics(BallSettings settings, ArenaSettings arena);

    BallStepEvents Step(double fixed_delta_seconds, BallState& ball) const;

    bool IsTouchingCar(const CarState& car, const BallState& ball) const;

    // Pushes the ball away from an overlapping car. The push blends from
    // "away from the car" at low car speed toward the car's direction of travel.
    bool ApplyCarHit(const CarState& car, double fixed_delta_seconds, BallState& ball) const;

    BallState MakeSpawnedBall(Tick tick) const;

    const BallSettings& Settings() const;

private:
    BallSettings settings_{};
    ArenaSettings arena_{};
};

}  // namespace pitchsync::sim

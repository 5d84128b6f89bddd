#pragma once

#include "sim/arena.h"
#include "sim/entity_state.h"
#include "sim/input_sample.h"

namespace pitchsync::sim {

struct CarStepEvents final {
    bool jumped = false;
    bool landed = false;
    bool boosting = false;
    bool recovered = false;
};

// Advances one car by one fixed step. Implementations must be pure functions
// of (input, delta, state): reconciliation replays them and expects the same
// result every time.
class ICarPhysics {
public:
    virtual ~ICarPhysics() = default;

    virtual CarStepEvents Step(
        const InputSample& input,
        double fixed_delta_seconds,
        CarState& state) const = 0;
};

struct CarPhysicsSettings final {
    float gravity = 9.81F;
    float ride_height = 0.35F;
    float body_half_height = 0.2F;
    float collision_radius = 0.9F;
    float contact_epsilon = 0.02F;
    float max_drive_speed = 14.1F;
    float throttle_acceleration = 16.0F;
    float brake_acceleration = 35.0F;
    float coast_deceleration = 2.5F;
    float max_steer_rate = 2.8F;
    float drift_side_friction = 2.0F;
    float side_friction_response = 10.0F;
    float downforce = 5.0F;
    float boost_acceleration = 9.91F;
    float max_boost_speed = 23.0F;
    float first_jump_velocity = 2.4F;
    float jump_hold_acceleration = 12.0F;
    float jump_hold_window = 0.15F;
    float jump_landing_reset = 0.1F;
    float recovery_up_velocity = 3.0F;
    float recovery_torque = 50.0F;
    float air_pitch_acceleration = 12.0F;
    float air_yaw_acceleration = 9.0F;
    float air_roll_acceleration = 14.0F;
    float air_angular_damping = 1.5F;
    float ground_angular_damping = 8.0F;
    float upright_alignment_rate = 10.0F;
    float wall_restitution = 0.2F;
    float max_angular_speed = 5.5F;
};

const CarPhysicsSettings& DefaultCarPhysicsSettings();

class ArenaCarPhysics final : public ICarPhysics {
public:
    ArenaCarPhysics();
    ArenaCarPhysics(CarPhysicsSettings settings, ArenaSettings arena);

    CarStepEvents Step(
        const InputSample& input,
        double fixed_delta_seconds,
        CarState& state) const override;

    // Recomputes wheel/body contact flags, the surface state and the forward
    // speed fields from the pose alone.
    void RefreshDerivedState(CarState& state) const;

    const CarPhysicsSettings& Settings() const;
    const ArenaSettings& Arena() const;

private:
    void ApplyGroundControl(const InputSample& input, float dt, CarState& state) const;
    void ApplyAirControl(const InputSample& input, float dt, CarState& state) const;
    void ApplyBoost(const InputSample& input, float dt, CarState& state, CarStepEvents& events) const;
    void ApplyJump(const InputSample& input, float dt, CarState& state, CarStepEvents& events) const;
    void ApplyRecovery(const InputSample& input, CarState& state, CarStepEvents& events) const;
    void Integrate(float dt, CarState& state) const;
    void ResolveArenaContacts(float dt, CarState& state) const;

    CarPhysicsSettings settings_{};
    ArenaSettings arena_{};
};

}  // namespace pitchsync::sim

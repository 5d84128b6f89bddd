#include "sim/car_physics.h"

#include <algorithm>
#include <cmath>

namespace pitchsync::sim {
namespace {

constexpr core::Vec3 kWorldUp{.x = 0.0F, .y = 1.0F, .z = 0.0F};
constexpr core::Vec3 kLocalForward{.x = 0.0F, .y = 0.0F, .z = 1.0F};
constexpr core::Vec3 kLocalRight{.x = 1.0F, .y = 0.0F, .z = 0.0F};

core::Vec3 Forward(const core::Quat& rotation) {
    return core::Rotate(rotation, kLocalForward);
}

core::Vec3 Up(const core::Quat& rotation) {
    return core::Rotate(rotation, kWorldUp);
}

core::Vec3 Right(const core::Quat& rotation) {
    return core::Rotate(rotation, kLocalRight);
}

float SignOf(float value) {
    return value < 0.0F ? -1.0F : 1.0F;
}

float RoundToCentimetres(float value) {
    return std::round(value * 100.0F) / 100.0F;
}

core::Quat YawOnly(const core::Quat& rotation) {
    core::Vec3 flat_forward = Forward(rotation);
    flat_forward.y = 0.0F;
    if (core::Length(flat_forward) <= 1e-4F) {
        return core::Quat{};
    }
    flat_forward = core::Normalize(flat_forward);
    return core::FromAxisAngle(kWorldUp, std::atan2(flat_forward.x, flat_forward.z));
}

}  // namespace

const CarPhysicsSettings& DefaultCarPhysicsSettings() {
    static const CarPhysicsSettings settings{};
    return settings;
}

ArenaCarPhysics::ArenaCarPhysics()
    : ArenaCarPhysics(DefaultCarPhysicsSettings(), DefaultArenaSettings()) {}

ArenaCarPhysics::ArenaCarPhysics(CarPhysicsSettings settings, ArenaSettings arena)
    : settings_(settings),
      arena_(arena) {}

const CarPhysicsSettings& ArenaCarPhysics::Settings() const {
    return settings_;
}

const ArenaSettings& ArenaCarPhysics::Arena() const {
    return arena_;
}

CarStepEvents ArenaCarPhysics::Step(
    const InputSample& input,
    double fixed_delta_seconds,
    CarState& state) const {
    CarStepEvents events{};
    const float dt = static_cast<float>(fixed_delta_seconds);
    if (dt <= 0.0F) {
        return events;
    }

    const bool was_touching = state.all_wheels_on_surface || state.body_on_surface;

    if (state.can_drive) {
        ApplyGroundControl(input, dt, state);
    } else if (state.surface_state == CarSurfaceState::Air) {
        ApplyAirControl(input, dt, state);
    }

    ApplyBoost(input, dt, state, events);
    ApplyJump(input, dt, state, events);
    ApplyRecovery(input, state, events);
    Integrate(dt, state);
    ResolveArenaContacts(dt, state);
    RefreshDerivedState(state);

    const bool is_touching = state.all_wheels_on_surface || state.body_on_surface;
    events.landed = !was_touching && is_touching;
    return events;
}

void ArenaCarPhysics::RefreshDerivedState(CarState& state) const {
    const core::Vec3 up = Up(state.rotation);
    const float upness = core::Dot(kWorldUp, up);

    const bool wheel_contact =
        upness > 0.5F && state.position.y <= settings_.ride_height + settings_.contact_epsilon;
    state.wheels_on_surface_count = wheel_contact ? (upness > 0.9F ? 4 : 2) : 0;
    state.body_on_surface =
        !wheel_contact &&
        state.position.y <= settings_.body_half_height + settings_.contact_epsilon;
    state.all_wheels_on_surface = state.wheels_on_surface_count >= 3;

    // Later rules override earlier ones.
    CarSurfaceState surface = state.surface_state;
    if (state.all_wheels_on_surface) {
        surface = CarSurfaceState::AllWheelsSurface;
    }
    if (!state.all_wheels_on_surface && !state.body_on_surface) {
        surface = CarSurfaceState::SomeWheelsSurface;
    }
    if (state.body_on_surface && !state.all_wheels_on_surface) {
        surface = CarSurfaceState::BodySideGround;
    }
    if (state.all_wheels_on_surface && upness > 0.95F) {
        surface = CarSurfaceState::AllWheelsGround;
    }
    if (state.body_on_surface && upness < -0.95F) {
        surface = CarSurfaceState::BodyGroundDead;
    }
    if (!state.body_on_surface && state.wheels_on_surface_count == 0) {
        surface = CarSurfaceState::Air;
    }
    state.surface_state = surface;
    state.can_drive =
        surface == CarSurfaceState::AllWheelsSurface || surface == CarSurfaceState::AllWheelsGround;

    state.forward_speed = RoundToCentimetres(core::Dot(state.linear_velocity, Forward(state.rotation)));
    state.forward_speed_abs = std::fabs(state.forward_speed);
    state.forward_speed_sign = SignOf(state.forward_speed);
}

void ArenaCarPhysics::ApplyGroundControl(const InputSample& input, float dt, CarState& state) const {
    const core::Vec3 forward = Forward(state.rotation);
    const core::Vec3 right = Right(state.rotation);
    const core::Vec3 up = Up(state.rotation);
    const float forward_speed = core::Dot(state.linear_velocity, forward);

    if (input.throttle != 0.0F) {
        float acceleration = 0.0F;
        if (forward_speed * input.throttle < 0.0F) {
            acceleration = settings_.brake_acceleration * input.throttle;
        } else if (std::fabs(forward_speed) < settings_.max_drive_speed) {
            acceleration = settings_.throttle_acceleration * input.throttle;
        }
        state.linear_velocity += forward * (acceleration * dt);
    } else if (forward_speed != 0.0F) {
        const float slowdown = std::min(std::fabs(forward_speed), settings_.coast_deceleration * dt);
        state.linear_velocity -= forward * (SignOf(forward_speed) * slowdown);
    }

    const float target_friction =
        input.drift ? settings_.drift_side_friction : kDefaultWheelSideFriction;
    state.wheel_side_friction +=
        (target_friction - state.wheel_side_friction) *
        std::min(1.0F, settings_.side_friction_response * dt);

    const float lateral_speed = core::Dot(state.linear_velocity, right);
    state.linear_velocity -= right * (lateral_speed * std::min(1.0F, state.wheel_side_friction * dt));

    const float speed_factor = core::Clamp01(std::fabs(forward_speed) / 5.0F);
    const float yaw_rate =
        input.steer * settings_.max_steer_rate * speed_factor * SignOf(forward_speed);
    state.angular_velocity = up * yaw_rate;

    state.linear_velocity -= up * (settings_.downforce * dt);
}

void ArenaCarPhysics::ApplyAirControl(const InputSample& input, float dt, CarState& state) const {
    const core::Vec3 forward = Forward(state.rotation);
    const core::Vec3 right = Right(state.rotation);
    const core::Vec3 up = Up(state.rotation);

    const float roll_input = input.air_roll ? input.steer : input.roll;
    const float yaw_input = input.air_roll ? 0.0F : input.yaw;

    state.angular_velocity += right * (input.pitch * settings_.air_pitch_acceleration * dt);
    state.angular_velocity += up * (yaw_input * settings_.air_yaw_acceleration * dt);
    state.angular_velocity += forward * (roll_input * settings_.air_roll_acceleration * dt);
    state.angular_velocity -=
        state.angular_velocity * std::min(1.0F, settings_.air_angular_damping * dt);
}

void ArenaCarPhysics::ApplyBoost(
    const InputSample& input,
    float dt,
    CarState& state,
    CarStepEvents& events) const {
    if (!input.boost || state.forward_speed >= settings_.max_boost_speed) {
        return;
    }

    state.linear_velocity += Forward(state.rotation) * (settings_.boost_acceleration * dt);
    events.boosting = true;
}

void ArenaCarPhysics::ApplyJump(
    const InputSample& input,
    float dt,
    CarState& state,
    CarStepEvents& events) const {
    const core::Vec3 up = Up(state.rotation);
    const bool flipped = core::Dot(kWorldUp, up) < 0.0F;
    const core::Vec3 jump_direction = flipped ? kWorldUp : up;

    if (input.jump && state.can_first_jump) {
        state.linear_velocity += jump_direction * settings_.first_jump_velocity;
        state.can_keep_jumping = true;
        state.can_first_jump = false;
        state.jumping = true;
        state.jump_timer += dt;
        events.jumped = true;
    }

    if (input.jump && state.jumping && state.can_keep_jumping &&
        state.jump_timer <= settings_.jump_hold_window) {
        state.linear_velocity += jump_direction * (settings_.jump_hold_acceleration * dt);
        state.jump_timer += dt;
    }

    if (input.jump_released) {
        state.can_keep_jumping = false;
    }

    const bool touching = state.all_wheels_on_surface || state.body_on_surface;
    if (touching && !events.jumped) {
        if (state.jump_timer >= settings_.jump_landing_reset) {
            state.jumping = false;
        }
        state.jump_timer = 0.0F;
        state.can_first_jump = true;
    } else if (!touching) {
        state.can_first_jump = false;
    }
}

void ArenaCarPhysics::ApplyRecovery(
    const InputSample& input,
    CarState& state,
    CarStepEvents& events) const {
    if (state.surface_state != CarSurfaceState::BodyGroundDead || !input.jump_pressed) {
        return;
    }

    state.linear_velocity += kWorldUp * settings_.recovery_up_velocity;
    state.angular_velocity += Forward(state.rotation) * settings_.recovery_torque;
    events.recovered = true;
}

void ArenaCarPhysics::Integrate(float dt, CarState& state) const {
    state.linear_velocity.y -= settings_.gravity * dt;
    state.angular_velocity = core::ClampLength(state.angular_velocity, settings_.max_angular_speed);
    state.rotation = core::IntegrateAngularVelocity(state.rotation, state.angular_velocity, dt);
    state.position += state.linear_velocity * dt;
}

void ArenaCarPhysics::ResolveArenaContacts(float dt, CarState& state) const {
    const float upness = core::Dot(kWorldUp, Up(state.rotation));
    const float floor_height = upness > 0.5F ? settings_.ride_height : settings_.body_half_height;

    if (state.position.y <= floor_height) {
        state.position.y = floor_height;
        if (state.linear_velocity.y < 0.0F) {
            state.linear_velocity.y = 0.0F;
        }

        if (upness > 0.5F) {
            state.rotation = core::Slerp(
                state.rotation,
                YawOnly(state.rotation),
                std::min(1.0F, settings_.upright_alignment_rate * dt));
            state.angular_velocity = kWorldUp * core::Dot(state.angular_velocity, kWorldUp);
        } else {
            const float damping = std::min(1.0F, settings_.ground_angular_damping * dt);
            state.angular_velocity -= state.angular_velocity * damping;
            state.linear_velocity.x -= state.linear_velocity.x * damping;
            state.linear_velocity.z -= state.linear_velocity.z * damping;
        }
    }

    const float x_limit = arena_.half_width - settings_.collision_radius;
    if (state.position.x > x_limit || state.position.x < -x_limit) {
        state.position.x = std::clamp(state.position.x, -x_limit, x_limit);
        if (state.position.x * state.linear_velocity.x > 0.0F) {
            state.linear_velocity.x = -state.linear_velocity.x * settings_.wall_restitution;
        }
    }

    const float z_limit = arena_.half_length - settings_.collision_radius;
    if (state.position.z > z_limit || state.position.z < -z_limit) {
        state.position.z = std::clamp(state.position.z, -z_limit, z_limit);
        if (state.position.z * state.linear_velocity.z > 0.0F) {
            state.linear_velocity.z = -state.linear_velocity.z * settings_.wall_restitution;
        }
    }

    const float ceiling = arena_.ceiling_height - settings_.collision_radius;
    if (state.position.y > ceiling) {
        state.position.y = ceiling;
        if (state.linear_velocity.y > 0.0F) {
            state.linear_velocity.y = -state.linear_velocity.y * settings_.wall_restitution;
        }
    }
}

}  // namespace pitchsync::sim

#include "sim/ball_physics.h"

#include <algorithm>
#include <cmath>

namespace pitchsync::sim {
namespace {

constexpr core::Vec3 kWorldUp{.x = 0.0F, .y = 1.0F, .z = 0.0F};

bool InsideGoalMouth(const ArenaSettings& arena, const core::Vec3& position) {
    return std::fabs(position.x) < arena.goal_half_width && position.y < arena.goal_height;
}

}  // namespace

const BallSettings& DefaultBallSettings() {
    static const BallSettings settings{};
    return settings;
}

BallPhysics::BallPhysics()
    : BallPhysics(DefaultBallSettings(), DefaultArenaSettings()) {}

BallPhysics::BallPhysics(BallSettings settings, ArenaSettings arena)
    : settings_(settings),
      arena_(arena) {}

const BallSettings& BallPhysics::Settings() const {
    return settings_;
}

BallState BallPhysics::MakeSpawnedBall(Tick tick) const {
    BallState ball{};
    ball.tick = tick;
    ball.position = arena_.ball_spawn;
    return ball;
}

BallStepEvents BallPhysics::Step(double fixed_delta_seconds, BallState& ball) const {
    BallStepEvents events{};
    const float dt = static_cast<float>(fixed_delta_seconds);
    if (dt <= 0.0F) {
        return events;
    }

    ball.linear_velocity.y -= settings_.gravity * dt;
    ball.linear_velocity = core::ClampLength(ball.linear_velocity, settings_.max_speed);
    ball.position += ball.linear_velocity * dt;

    const float radius = settings_.radius;
    if (ball.position.y < radius) {
        ball.position.y = radius;
        if (ball.linear_velocity.y < 0.0F) {
            const float impact_speed = -ball.linear_velocity.y;
            ball.linear_velocity.y = impact_speed * settings_.floor_restitution;
            // Settle instead of micro-bouncing forever.
            if (ball.linear_velocity.y < settings_.gravity * dt * 2.0F) {
                ball.linear_velocity.y = 0.0F;
            } else {
                events.bounced = true;
            }
        }

        const float damping = std::min(1.0F, settings_.rolling_damping * dt);
        ball.linear_velocity.x -= ball.linear_velocity.x * damping;
        ball.linear_velocity.z -= ball.linear_velocity.z * damping;
        ball.angular_velocity = core::Cross(kWorldUp, ball.linear_velocity) * (1.0F / radius);
    }

    const float ceiling = arena_.ceiling_height - radius;
    if (ball.position.y > ceiling) {
        ball.position.y = ceiling;
        if (ball.linear_velocity.y > 0.0F) {
            ball.linear_velocity.y = -ball.linear_velocity.y * settings_.wall_restitution;
            events.bounced = true;
        }
    }

    const float x_limit = arena_.half_width - radius;
    if (ball.position.x > x_limit || ball.position.x < -x_limit) {
        ball.position.x = std::clamp(ball.position.x, -x_limit, x_limit);
        if (ball.position.x * ball.linear_velocity.x > 0.0F) {
            ball.linear_velocity.x = -ball.linear_velocity.x * settings_.wall_restitution;
            events.bounced = true;
        }
    }

    const float z_limit = arena_.half_length - radius;
    if (ball.position.z > z_limit || ball.position.z < -z_limit) {
        if (InsideGoalMouth(arena_, ball.position)) {
            if (ball.position.z > arena_.half_length + radius) {
                events.goal = GoalSide::PositiveZ;
            } else if (ball.position.z < -(arena_.half_length + radius)) {
                events.goal = GoalSide::NegativeZ;
            }

            const float back_limit = arena_.half_length + arena_.goal_depth - radius;
            if (std::fabs(ball.position.z) > back_limit) {
                ball.position.z = std::clamp(ball.position.z, -back_limit, back_limit);
                ball.linear_velocity.z = -ball.linear_velocity.z * settings_.wall_restitution;
            }
        } else {
            ball.position.z = std::clamp(ball.position.z, -z_limit, z_limit);
            if (ball.position.z * ball.linear_velocity.z > 0.0F) {
                ball.linear_velocity.z = -ball.linear_velocity.z * settings_.wall_restitution;
                events.bounced = true;
            }
        }
    }

    ball.rotation = core::IntegrateAngularVelocity(ball.rotation, ball.angular_velocity, dt);
    return events;
}

bool BallPhysics::IsTouchingCar(const CarState& car, const BallState& ball) const {
    const float contact_distance = settings_.radius + settings_.car_contact_radius;
    return core::Distance(car.position, ball.position) <= contact_distance;
}

bool BallPhysics::ApplyCarHit(const CarState& car, double fixed_delta_seconds, BallState& ball) const {
    if (!IsTouchingCar(car, ball)) {
        return false;
    }

    const float dt = static_cast<float>(fixed_delta_seconds);
    const float car_speed = core::Length(car.linear_velocity);
    const float force = settings_.hit_base_force + car_speed * settings_.hit_speed_multiplier;

    core::Vec3 push_away = core::Normalize(ball.position - car.position);
    if (core::Length(push_away) <= 0.0F) {
        push_away = kWorldUp;
    }
    const core::Vec3 car_direction =
        car_speed > settings_.hit_min_direction_speed ? core::Normalize(car.linear_velocity) : push_away;
    const float velocity_blend = core::Clamp01(car_speed / settings_.hit_full_blend_speed);
    core::Vec3 hit_direction = core::Normalize(core::Lerp(push_away, car_direction, velocity_blend));
    if (core::Length(hit_direction) <= 0.0F) {
        hit_direction = push_away;
    }

    ball.linear_velocity += hit_direction * (force * dt / settings_.mass);

    const float contact_distance = settings_.radius + settings_.car_contact_radius;
    ball.position = car.position + push_away * contact_distance;
    if (ball.position.y < settings_.radius) {
        ball.position.y = settings_.radius;
    }
    return true;
}

}  // namespace pitchsync::sim

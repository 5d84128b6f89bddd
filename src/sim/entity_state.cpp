#include "sim/entity_state.h"

namespace pitchsync::sim {

const char* CarSurfaceStateName(CarSurfaceState state) {
    switch (state) {
        case CarSurfaceState::AllWheelsGround:
            return "all_wheels_ground";
        case CarSurfaceState::Air:
            return "air";
        case CarSurfaceState::AllWheelsSurface:
            return "all_wheels_surface";
        case CarSurfaceState::SomeWheelsSurface:
            return "some_wheels_surface";
        case CarSurfaceState::BodySideGround:
            return "body_side_ground";
        case CarSurfaceState::BodyGroundDead:
            return "body_ground_dead";
    }

    return "unknown";
}

RemoteCarSnapshot MakeRemoteSnapshot(const CarState& state) {
    return RemoteCarSnapshot{
        .tick = state.tick,
        .position = state.position,
        .rotation = state.rotation,
        .linear_velocity = state.linear_velocity,
    };
}

CarState MakeSpawnedCarState(Tick tick, const core::Vec3& position, const core::Quat& rotation) {
    CarState state{};
    state.tick = tick;
    state.position = position;
    state.rotation = rotation;
    state.can_first_jump = true;
    return state;
}

}  // namespace pitchsync::sim

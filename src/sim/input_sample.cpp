#include "sim/input_sample.h"

#include <algorithm>

namespace pitchsync::sim {
namespace {

float ClampAxis(float value) {
    return std::clamp(value, -1.0F, 1.0F);
}

}  // namespace

InputSample NeutralInput(Tick tick) {
    InputSample sample{};
    sample.tick = tick;
    return sample;
}

void InputLatch::Accumulate(const InputFrame& frame) {
    if (frame.jump && !jump_held_) {
        jump_pressed_latched_ = true;
    }
    if (!frame.jump && jump_held_) {
        jump_released_latched_ = true;
    }

    jump_held_ = frame.jump;
    current_ = frame;
}

InputSample InputLatch::Capture(Tick tick) {
    const InputSample sample{
        .tick = tick,
        .throttle = ClampAxis(current_.throttle),
        .steer = ClampAxis(current_.steer),
        .yaw = ClampAxis(current_.yaw),
        .pitch = ClampAxis(current_.pitch),
        .roll = ClampAxis(current_.roll),
        .boost = current_.boost,
        .drift = current_.drift,
        .air_roll = current_.air_roll,
        .jump = current_.jump,
        .jump_pressed = jump_pressed_latched_,
        .jump_released = jump_released_latched_,
    };

    jump_pressed_latched_ = false;
    jump_released_latched_ = false;
    return sample;
}

void InputLatch::Reset() {
    current_ = {};
    jump_held_ = false;
    jump_pressed_latched_ = false;
    jump_released_latched_ = false;
}

bool InputLatch::HasPendingPress() const {
    return jump_pressed_latched_;
}

bool InputLatch::HasPendingRelease() const {
    return jump_released_latched_;
}

}  // namespace pitchsync::sim

#pragma once

#include "sim/tick.h"

namespace pitchsync::sim {

struct InputSample final {
    Tick tick = kInvalidTick;
    float throttle = 0.0F;
    float steer = 0.0F;
    float yaw = 0.0F;
    float pitch = 0.0F;
    float roll = 0.0F;
    bool boost = false;
    bool drift = false;
    bool air_roll = false;
    bool jump = false;
    bool jump_pressed = false;
    bool jump_released = false;
};

InputSample NeutralInput(Tick tick);

// Continuous control values read once per render frame.
struct InputFrame final {
    float throttle = 0.0F;
    float steer = 0.0F;
    float yaw = 0.0F;
    float pitch = 0.0F;
    float roll = 0.0F;
    bool boost = false;
    bool drift = false;
    bool air_roll = false;
    bool jump = false;
};

// Keeps jump press/release edges seen between fixed steps until the next
// sample is captured, so a tap shorter than one tick is never lost.
class InputLatch final {
public:
    void Accumulate(const InputFrame& frame);
    InputSample Capture(Tick tick);
    void Reset();

    bool HasPendingPress() const;
    bool HasPendingRelease() const;

private:
    InputFrame current_{};
    bool jump_held_ = false;
    bool jump_pressed_latched_ = false;
    bool jump_released_latched_ = false;
};

}  // namespace pitchsync::sim

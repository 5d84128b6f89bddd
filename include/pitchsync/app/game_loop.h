#pragma once

#include <functional>

namespace pitchsync::app {

class GameLoop final {
public:
    using PumpEventsFn = std::function<bool()>;
    using UpdateFn = std::function<void(double)>;
    // Receives the leftover fraction of a fixed step and the real time of the
    // frame (clamped like the fixed-step accumulator).
    using RenderFn = std::function<void(float, double)>;

    explicit GameLoop(double fixed_delta_seconds);

    void Run(const PumpEventsFn& pump_events, const UpdateFn& update, const RenderFn& render);

    // Runs the fixed steps owed for one frame of `frame_seconds` and returns
    // the leftover fraction of a step.
    float AdvanceFrame(double frame_seconds, const UpdateFn& update);

    double FixedDeltaSeconds() const;

    static double ClampFrameSeconds(double frame_seconds);

private:
    double fixed_delta_seconds_ = 1.0 / 60.0;
    double accumulator_ = 0.0;
};

}  // namespace pitchsync::app

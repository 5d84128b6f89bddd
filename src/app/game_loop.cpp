#include "app/game_loop.h"

#include <algorithm>
#include <chrono>

namespace pitchsync::app {
namespace {

constexpr double kMaxFrameClampSeconds = 0.25;

}  // namespace

GameLoop::GameLoop(double fixed_delta_seconds)
    : fixed_delta_seconds_(fixed_delta_seconds > 0.0 ? fixed_delta_seconds : 1.0 / 60.0) {}

void GameLoop::Run(const PumpEventsFn& pump_events, const UpdateFn& update, const RenderFn& render) {
    auto previous_time = std::chrono::steady_clock::now();
    accumulator_ = 0.0;

    while (pump_events()) {
        const auto now = std::chrono::steady_clock::now();
        const double frame_seconds =
            std::chrono::duration<double>(now - previous_time).count();
        previous_time = now;

        const float interpolation_alpha = AdvanceFrame(frame_seconds, update);
        render(interpolation_alpha, ClampFrameSeconds(frame_seconds));
    }
}

float GameLoop::AdvanceFrame(double frame_seconds, const UpdateFn& update) {
    accumulator_ += ClampFrameSeconds(frame_seconds);
    while (accumulator_ >= fixed_delta_seconds_) {
        update(fixed_delta_seconds_);
        accumulator_ -= fixed_delta_seconds_;
    }

    return static_cast<float>(accumulator_ / fixed_delta_seconds_);
}

double GameLoop::FixedDeltaSeconds() const {
    return fixed_delta_seconds_;
}

double GameLoop::ClampFrameSeconds(double frame_seconds) {
    return std::clamp(frame_seconds, 0.0, kMaxFrameClampSeconds);
}

}  // namespace pitchsync::app

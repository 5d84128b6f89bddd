#include "sim/remote_replicator.h"

#include <cmath>
#include <iostream>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

bool NearlyEqual(double lhs, double rhs) {
    return std::fabs(lhs - rhs) < 1e-4;
}

constexpr double kFixedDelta = 1.0 / 60.0;

pitchsync::sim::RemoteCarSnapshot CarAt(pitchsync::sim::Tick tick, float x) {
    pitchsync::sim::RemoteCarSnapshot snapshot{};
    snapshot.tick = tick;
    snapshot.position.x = x;
    return snapshot;
}

bool TestCarInterpolatesBetweenBroadcasts() {
    bool passed = true;
    pitchsync::sim::RemoteCarReplicator replicator(pitchsync::sim::RemoteCarReplicatorSettings{
        .fixed_delta_seconds = kFixedDelta,
        .min_interpolation_seconds = 0.033,
    });

    passed &= Expect(!replicator.HasSnapshot(), "Replicator should start empty.");
    passed &= Expect(replicator.PushSnapshot(CarAt(0, 0.0F)), "First snapshot should be accepted.");
    passed &= Expect(replicator.Transform().position.x == 0.0F, "First snapshot should be shown as is.");

    passed &= Expect(replicator.PushSnapshot(CarAt(6, 6.0F)), "Newer snapshot should be accepted.");
    passed &= Expect(
        NearlyEqual(replicator.InterpolationSeconds(), 0.1),
        "Six ticks at 60 Hz should interpolate over 0.1 s.");
    passed &= Expect(replicator.Progress() == 0.0, "New target should restart the interpolation.");

    replicator.Advance(3.0 * kFixedDelta);
    passed &= Expect(NearlyEqual(replicator.Progress(), 0.5), "Three ticks in should be halfway.");
    passed &= Expect(NearlyEqual(replicator.Transform().position.x, 3.0), "Halfway pose should be the midpoint.");

    replicator.Advance(1.0);
    passed &= Expect(replicator.Progress() == 1.0, "Progress should clamp at the newest snapshot.");
    passed &= Expect(replicator.Transform().position.x == 6.0F, "Car should hold at the newest snapshot.");

    passed &= Expect(!replicator.PushSnapshot(CarAt(6, 9.0F)), "Same tick should be rejected.");
    passed &= Expect(!replicator.PushSnapshot(CarAt(3, 9.0F)), "Older tick should be rejected.");
    passed &= Expect(replicator.Target().position.x == 6.0F, "Rejected snapshots should not change the target.");

    passed &= Expect(replicator.PushSnapshot(CarAt(7, 7.0F)), "Adjacent tick should be accepted.");
    passed &= Expect(
        NearlyEqual(replicator.InterpolationSeconds(), 0.033),
        "Interpolation time should not drop below the floor.");
    return passed;
}

bool TestBallFollowsSplineThenArc() {
    bool passed = true;
    const pitchsync::sim::RemoteBallReplicatorSettings settings{
        .fixed_delta_seconds = kFixedDelta,
        .min_interpolation_seconds = 0.016,
        .max_extrapolation_seconds = 0.25,
        .gravity = 9.81F,
        .floor_height = 0.9F,
    };
    pitchsync::sim::RemoteBallReplicator replicator(settings);

    pitchsync::sim::BallState first{};
    first.tick = 0;
    first.position = {.x = 0.0F, .y = 5.0F, .z = 0.0F};
    first.linear_velocity = {.x = 10.0F, .y = 0.0F, .z = 0.0F};
    pitchsync::sim::BallState second = first;
    second.tick = 6;
    second.position = {.x = 1.0F, .y = 5.0F, .z = 0.0F};

    replicator.PushSnapshot(first);
    replicator.PushSnapshot(second);
    passed &= Expect(!replicator.IsExtrapolating(), "Fresh target should interpolate.");
    passed &= Expect(replicator.Transform().position.x == 0.0F, "Spline should start on the older snapshot.");

    replicator.Advance(0.1);
    passed &= Expect(NearlyEqual(replicator.Transform().position.x, 1.0), "Spline should end on the newer snapshot.");

    replicator.Advance(0.1);
    passed &= Expect(replicator.IsExtrapolating(), "Running past the newest snapshot should extrapolate.");
    passed &= Expect(NearlyEqual(replicator.ExtrapolatedSeconds(), 0.1), "Extrapolation time should be tracked.");
    const pitchsync::core::Vec3 arc = replicator.Transform().position;
    passed &= Expect(NearlyEqual(arc.x, 2.0), "Extrapolation should follow the last velocity.");
    passed &= Expect(NearlyEqual(arc.y, 5.0 - 0.5 * 9.81 * 0.01), "Extrapolation should apply gravity.");

    replicator.Advance(5.0);
    passed &= Expect(NearlyEqual(replicator.ExtrapolatedSeconds(), 0.25), "Extrapolation should stop at the cap.");
    const pitchsync::core::Vec3 capped = replicator.Transform().position;
    replicator.Advance(5.0);
    passed &= Expect(replicator.Transform().position == capped, "Pose should hold once the cap is reached.");
    passed &= Expect(NearlyEqual(capped.x, 3.5), "Capped pose should be 0.25 s along the arc.");

    pitchsync::sim::BallState falling = second;
    falling.tick = 12;
    falling.position = {.x = 0.0F, .y = 1.0F, .z = 0.0F};
    falling.linear_velocity = {.x = 0.0F, .y = -10.0F, .z = 0.0F};
    passed &= Expect(replicator.PushSnapshot(falling), "New snapshot should end extrapolation.");
    passed &= Expect(!replicator.IsExtrapolating(), "New snapshot should restart interpolation.");
    replicator.Advance(0.5);
    passed &= Expect(
        replicator.Transform().position.y >= settings.floor_height,
        "Extrapolated ball should not sink below the floor.");
    return passed;
}

}  // namespace

int main() {
    bool passed = true;
    passed &= TestCarInterpolatesBetweenBroadcasts();
    passed &= TestBallFollowsSplineThenArc();

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] pitchsync_remote_replicator_tests\n";
    return 0;
}

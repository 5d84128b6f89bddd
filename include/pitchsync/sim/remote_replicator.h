#pragma once

#include "sim/entity_state.h"

namespace pitchsync::sim {

struct RemoteCarReplicatorSettings final {
    double fixed_delta_seconds = 1.0 / 60.0;
    double min_interpolation_seconds = 0.033;
};

// Render-only smoothing of a car this client does not own. Interpolates
// linearly between the last two broadcasts and clamps at the newest one.
class RemoteCarReplicator final {
public:
    explicit RemoteCarReplicator(RemoteCarReplicatorSettings settings);

    // Returns false when the snapshot is not newer than the current target.
    bool PushSnapshot(const RemoteCarSnapshot& snapshot);
    void Advance(double delta_seconds);

    RenderTransform Transform() const;
    bool HasSnapshot() const;
    double Progress() const;
    double InterpolationSeconds() const;
    const RemoteCarSnapshot& Target() const;

private:
    RemoteCarReplicatorSettings settings_{};
    bool has_snapshot_ = false;
    RemoteCarSnapshot from_{};
    RemoteCarSnapshot to_{};
    double progress_ = 1.0;
    double interpolation_seconds_ = 0.0;
};

struct RemoteBallReplicatorSettings final {
    double fixed_delta_seconds = 1.0 / 60.0;
    double min_interpolation_seconds = 0.016;
    double max_extrapolation_seconds = 0.25;
    float gravity = 9.81F;
    float floor_height = 0.9F;
};

// Render-only ball: Hermite spline between snapshots using their velocities,
// then a ballistic arc from the newest snapshot for a bounded time, then hold.
class RemoteBallReplicator final {
public:
    explicit RemoteBallReplicator(RemoteBallReplicatorSettings settings);

    bool PushSnapshot(const BallState& snapshot);
    void Advance(double delta_seconds);

    RenderTransform Transform() const;
    bool HasSnapshot() const;
    bool IsExtrapolating() const;
    double Progress() const;
    double InterpolationSeconds() const;
    double ExtrapolatedSeconds() const;

private:
    RemoteBallReplicatorSettings settings_{};
    bool has_snapshot_ = false;
    BallState from_{};
    BallState to_{};
    double progress_ = 1.0;
    double interpolation_seconds_ = 0.0;
};

}  // namespace pitchsync::sim

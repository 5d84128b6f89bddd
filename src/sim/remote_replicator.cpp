#include "sim/remote_replicator.h"

#include <algorithm>

namespace pitchsync::sim {
namespace {

double InterpolationSecondsFor(Tick from_tick, Tick to_tick, double fixed_delta_seconds, double minimum) {
    const double span = static_cast<double>(to_tick - from_tick) * fixed_delta_seconds;
    return std::max(span, minimum);
}

}  // namespace

RemoteCarReplicator::RemoteCarReplicator(RemoteCarReplicatorSettings settings)
    : settings_(settings),
      interpolation_seconds_(settings.min_interpolation_seconds) {}

bool RemoteCarReplicator::PushSnapshot(const RemoteCarSnapshot& snapshot) {
    if (snapshot.tick == kInvalidTick) {
        return false;
    }

    if (!has_snapshot_) {
        from_ = snapshot;
        to_ = snapshot;
        progress_ = 1.0;
        has_snapshot_ = true;
        return true;
    }

    if (snapshot.tick <= to_.tick) {
        return false;
    }

    from_ = to_;
    to_ = snapshot;
    progress_ = 0.0;
    interpolation_seconds_ = InterpolationSecondsFor(
        from_.tick,
        to_.tick,
        settings_.fixed_delta_seconds,
        settings_.min_interpolation_seconds);
    return true;
}

void RemoteCarReplicator::Advance(double delta_seconds) {
    if (!has_snapshot_ || delta_seconds <= 0.0) {
        return;
    }
    progress_ = std::clamp(progress_ + delta_seconds / interpolation_seconds_, 0.0, 1.0);
}

RenderTransform RemoteCarReplicator::Transform() const {
    const float t = static_cast<float>(progress_);
    return RenderTransform{
        .position = core::Lerp(from_.position, to_.position, t),
        .rotation = core::Slerp(from_.rotation, to_.rotation, t),
    };
}

bool RemoteCarReplicator::HasSnapshot() const {
    return has_snapshot_;
}

double RemoteCarReplicator::Progress() const {
    return progress_;
}

double RemoteCarReplicator::InterpolationSeconds() const {
    return interpolation_seconds_;
}

const RemoteCarSnapshot& RemoteCarReplicator::Target() const {
    return to_;
}

RemoteBallReplicator::RemoteBallReplicator(RemoteBallReplicatorSettings settings)
    : settings_(settings),
      interpolation_seconds_(settings.min_interpolation_seconds) {}

bool RemoteBallReplicator::PushSnapshot(const BallState& snapshot) {
    if (snapshot.tick == kInvalidTick) {
        return false;
    }

    if (!has_snapshot_) {
        from_ = snapshot;
        to_ = snapshot;
        progress_ = 1.0;
        has_snapshot_ = true;
        return true;
    }

    if (snapshot.tick <= to_.tick) {
        return false;
    }

    from_ = to_;
    to_ = snapshot;
    progress_ = 0.0;
    interpolation_seconds_ = InterpolationSecondsFor(
        from_.tick,
        to_.tick,
        settings_.fixed_delta_seconds,
        settings_.min_interpolation_seconds);
    return true;
}

void RemoteBallReplicator::Advance(double delta_seconds) {
    if (!has_snapshot_ || delta_seconds <= 0.0) {
        return;
    }

    // Past the cap the pose no longer changes, so progress stops growing too.
    const double max_progress = 1.0 + settings_.max_extrapolation_seconds / interpolation_seconds_;
    progress_ = std::min(progress_ + delta_seconds / interpolation_seconds_, max_progress);
}

RenderTransform RemoteBallReplicator::Transform() const {
    if (progress_ <= 1.0) {
        const float t = static_cast<float>(progress_);
        const float span = static_cast<float>(interpolation_seconds_);
        return RenderTransform{
            .position = core::Hermite(
                from_.position,
                from_.linear_velocity * span,
                to_.position,
                to_.linear_velocity * span,
                t),
            .rotation = core::Slerp(from_.rotation, to_.rotation, t),
        };
    }

    const float seconds = static_cast<float>(ExtrapolatedSeconds());
    core::Vec3 position = to_.position + to_.linear_velocity * seconds;
    position.y -= 0.5F * settings_.gravity * seconds * seconds;
    position.y = std::max(position.y, settings_.floor_height);
    return RenderTransform{
        .position = position,
        .rotation = core::IntegrateAngularVelocity(to_.rotation, to_.angular_velocity, seconds),
    };
}

bool RemoteBallReplicator::HasSnapshot() const {
    return has_snapshot_;
}

bool RemoteBallReplicator::IsExtrapolating() const {
    return has_snapshot_ && progress_ > 1.0;
}

double RemoteBallReplicator::Progress() const {
    return progress_;
}

double RemoteBallReplicator::InterpolationSeconds() const {
    return interpolation_seconds_;
}

double RemoteBallReplicator::ExtrapolatedSeconds() const {
    if (progress_ <= 1.0) {
        return 0.0;
    }
    return std::min((progress_ - 1.0) * interpolation_seconds_, settings_.max_extrapolation_seconds);
}

}  // namespace pitchsync::sim

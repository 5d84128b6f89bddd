#include "app/sync_settings.h"

#include <cstddef>

namespace pitchsync::app {

sim::MatchSettings MakeMatchSettings(const core::SyncConfig& config) {
    return sim::MatchSettings{
        .car = sim::AuthoritativeSimSettings{
            .owner_state_interval_ticks = config.owner_state_interval_ticks,
            .remote_state_interval_ticks = config.remote_state_interval_ticks,
            .buffer_capacity = static_cast<std::size_t>(config.ring_buffer_capacity),
        },
        .ball_state_interval_ticks = config.ball_state_interval_ticks,
        .status_interval_ticks = config.tick_rate_hz / 2,
        .match_duration_seconds = config.match_duration_seconds,
    };
}

ClientSessionSettings MakeClientSessionSettings(const core::SyncConfig& config) {
    const double fixed_delta_seconds = config.FixedDeltaSeconds();
    return ClientSessionSettings{
        .fixed_delta_seconds = fixed_delta_seconds,
        .max_catch_up_ticks = config.max_catch_up_ticks,
        .prediction = sim::PredictionSettings{
            .input_send_interval_ticks = config.input_send_interval_ticks,
            .buffer_capacity = static_cast<std::size_t>(config.ring_buffer_capacity),
        },
        .reconcile = sim::ReconcileSettings{
            .position_error_threshold = static_cast<float>(config.position_error_threshold),
            .rotation_error_threshold_deg = static_cast<float>(config.rotation_error_threshold_deg),
            .hard_snap_threshold = static_cast<float>(config.hard_snap_threshold),
            .correction_blend = static_cast<float>(config.correction_blend),
        },
        .remote_car = sim::RemoteCarReplicatorSettings{
            .fixed_delta_seconds = fixed_delta_seconds,
            .min_interpolation_seconds = config.remote_min_interp_seconds,
        },
        .ball = sim::RemoteBallReplicatorSettings{
            .fixed_delta_seconds = fixed_delta_seconds,
            .min_interpolation_seconds = config.ball_min_interp_seconds,
            .max_extrapolation_seconds = config.ball_max_extrapolation_seconds,
        },
    };
}

}  // namespace pitchsync::app

#include "app/render_scene_builder.h"

#include "core/math.h"

namespace pitchsync::app {
namespace {

constexpr core::Vec3 kCarForward{.x = 0.0F, .y = 0.0F, .z = 1.0F};

platform::RenderCar ToRenderCar(
    platform::RenderCarKind kind,
    std::uint8_t player_slot,
    const core::Vec3& position,
    const core::Quat& rotation) {
    core::Vec3 heading = core::Rotate(rotation, kCarForward);
    heading.y = 0.0F;
    if (core::Length(heading) < 1e-4F) {
        heading = kCarForward;
    }
    heading = core::Normalize(heading);

    return platform::RenderCar{
        .kind = kind,
        .player_slot = player_slot,
        .x = position.x,
        .z = position.z,
        .height = position.y,
        .heading_x = heading.x,
        .heading_z = heading.z,
    };
}

}  // namespace

platform::RenderScene RenderSceneBuilder::Build(
    const ClientSession& session,
    const sim::ArenaSettings& arena,
    const RenderOverlayState& overlay) const {
    platform::RenderScene scene{};
    scene.arena_half_width = arena.half_width;
    scene.arena_half_length = arena.half_length;
    scene.goal_half_width = arena.goal_half_width;

    if (overlay.show_debug_overlay && session.HasLocalCar() && session.HasAuthoritativeState()) {
        const sim::CarState& server_state = session.LastAuthoritativeState();
        scene.cars.push_back(ToRenderCar(
            platform::RenderCarKind::LocalServerGhost,
            session.LocalPlayerSlot(),
            server_state.position,
            server_state.rotation));
    }

    for (const CarView& car : session.CarViews()) {
        scene.cars.push_back(ToRenderCar(
            car.locally_predicted ? platform::RenderCarKind::Local : platform::RenderCarKind::Remote,
            car.player_slot,
            car.transform.position,
            car.transform.rotation));
    }

    if (session.HasBall()) {
        const sim::RenderTransform ball = session.BallTransform();
        scene.ball = platform::RenderBall{
            .visible = true,
            .extrapolating = session.IsBallExtrapolating(),
            .x = ball.position.x,
            .z = ball.position.z,
            .height = ball.position.y,
        };
    }

    const sim::MatchStatus& status = session.LatestMatchStatus();
    const ClientSessionDiagnostics diagnostics = session.DiagnosticsSnapshot();
    scene.hud = platform::RenderHudState{
        .connected = overlay.connected,
        .match_phase = static_cast<std::uint8_t>(status.phase),
        .score_player_one = status.score_player_one,
        .score_player_two = status.score_player_two,
        .remaining_seconds = status.remaining_seconds,
        .match_duration_seconds = overlay.match_duration_seconds,
        .show_debug_overlay = overlay.show_debug_overlay,
        .blended_correction_count = static_cast<std::uint32_t>(diagnostics.reconcile.blended_count),
        .snapped_correction_count = static_cast<std::uint32_t>(diagnostics.reconcile.snapped_count),
        .last_position_error = diagnostics.reconcile.last_position_error,
        .rtt_seconds = overlay.rtt_seconds,
    };
    return scene;
}

}  // namespace pitchsync::app

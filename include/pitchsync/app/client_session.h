#pragma once

#include "script/script_host.h"
#include "sim/car_physics.h"
#include "sim/entity_role.h"
#include "sim/match_world.h"
#include "sim/prediction_engine.h"
#include "sim/reconciler.h"
#include "sim/remote_replicator.h"
#include "sim/tick_clock.h"

#include <entt/entt.hpp>

#include <array>
#include <cstdint>
#include <vector>

namespace pitchsync::app {

struct ClientSessionSettings final {
    double fixed_delta_seconds = 1.0 / 60.0;
    // Further behind than this and the local car is re-anchored instead of
    // stepped tick by tick.
    int max_catch_up_ticks = 8;
    sim::PredictionSettings prediction{};
    sim::ReconcileSettings reconcile{};
    sim::RemoteCarReplicatorSettings remote_car{};
    sim::RemoteBallReplicatorSettings ball{};
};

struct ClientStepResult final {
    sim::Tick target_tick = sim::kInvalidTick;
    std::uint32_t predicted_tick_count = 0;
    bool re_anchored = false;
    sim::ReconcileResult reconcile{};
};

struct CarView final {
    std::uint8_t player_slot = 0;
    bool locally_predicted = false;
    sim::RenderTransform transform{};
};

struct ClientSessionDiagnostics final {
    bool has_local_car = false;
    std::uint8_t local_player_slot = 0;
    sim::Tick last_predicted_tick = sim::kInvalidTick;
    std::uint64_t re_anchor_count = 0;
    std::uint64_t held_step_count = 0;
    std::uint64_t ignored_own_remote_count = 0;
    std::uint64_t stale_remote_snapshot_count = 0;
    std::uint64_t stale_ball_snapshot_count = 0;
    std::uint64_t car_jump_event_count = 0;
    std::uint64_t car_land_event_count = 0;
    std::uint64_t suppressed_replay_event_count = 0;
    sim::PredictionDiagnostics prediction{};
    sim::ReconcileDiagnostics reconcile{};
};

// Client-side world: the owned car is predicted and reconciled, the other
// car and the ball are replicated for rendering only.
class ClientSession final : public sim::ICarEventListener {
public:
    ClientSession(
        const sim::ArenaCarPhysics& car_physics,
        sim::IInputSink& input_sink,
        script::IScriptHost& script_host,
        ClientSessionSettings settings);
    ~ClientSession() override;

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    // Non-owning. While a source is attached, prediction waits for it to
    // synchronize.
    void SetTimeSource(const sim::ISyncedTimeSource* time_source);
    void SetLocalPlayerSlot(std::uint8_t player_slot);
    // Forgets every entity, e.g. after a disconnect.
    void Clear();

    void AccumulateInput(const sim::InputFrame& frame);
    void ReceiveOwnerState(const sim::CarState& state);
    void ReceiveRemoteCar(std::uint8_t player_slot, const sim::RemoteCarSnapshot& snapshot);
    void ReceiveBallState(const sim::BallState& ball);
    void ReceiveMatchStatus(const sim::MatchStatus& status);

    // Fixed step: clock and prediction of the local car.
    ClientStepResult Step(double fixed_delta_seconds);
    // Once per rendered frame with the real elapsed time: smooths the remote
    // car and the ball.
    void AdvanceRender(double frame_seconds);

    void OnCarStepEvents(sim::Tick tick, const sim::CarState& state, const sim::CarStepEvents& events) override;

    bool HasLocalCar() const;
    bool HasLocalPlayerSlot() const;
    std::uint8_t LocalPlayerSlot() const;
    const sim::CarState* LocalCarState() const;
    bool HasAuthoritativeState() const;
    const sim::CarState& LastAuthoritativeState() const;
    std::vector<CarView> CarViews() const;
    bool HasBall() const;
    sim::RenderTransform BallTransform() const;
    bool IsBallExtrapolating() const;
    const sim::MatchStatus& LatestMatchStatus() const;
    sim::Tick LastTargetTick() const;
    ClientSessionDiagnostics DiagnosticsSnapshot() const;

private:
    sim::LocallyPredicted* LocalRole();
    const sim::LocallyPredicted* LocalRole() const;
    void SpawnLocalCar(const sim::CarState& state);
    void ReAnchor(sim::Tick target_tick);
    void DispatchCarEvent(const char* event_name, sim::Tick tick);

    const sim::ArenaCarPhysics& car_physics_;
    sim::IInputSink& input_sink_;
    script::IScriptHost& script_host_;
    ClientSessionSettings settings_{};
    sim::TickClock clock_;
    const sim::ISyncedTimeSource* time_source_ = nullptr;
    entt::registry registry_{};
    std::array<entt::entity, sim::kMaxPlayers> car_entities_{entt::null, entt::null};
    bool has_local_player_slot_ = false;
    std::uint8_t local_player_slot_ = 0;
    bool has_authoritative_state_ = false;
    sim::CarState last_authoritative_state_{};
    sim::RemoteBallReplicator ball_replicator_;
    sim::MatchStatus match_status_{};
    sim::Tick last_target_tick_ = sim::kInvalidTick;
    ClientSessionDiagnostics diagnostics_{};
};

}  // namespace pitchsync::app

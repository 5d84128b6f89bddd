#include "app/client_session.h"

#include "core/logger.h"
#include "sim/resimulation_scope.h"

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace pitchsync::app {

ClientSession::ClientSession(
    const sim::ArenaCarPhysics& car_physics,
    sim::IInputSink& input_sink,
    script::IScriptHost& script_host,
    ClientSessionSettings settings)
    : car_physics_(car_physics),
      input_sink_(input_sink),
      script_host_(script_host),
      settings_(settings),
      clock_(settings.fixed_delta_seconds),
      ball_replicator_(settings.ball) {}

ClientSession::~ClientSession() {
    registry_.clear();
}

void ClientSession::SetTimeSource(const sim::ISyncedTimeSource* time_source) {
    time_source_ = time_source;
    clock_.SetTimeSource(time_source);
}

void ClientSession::SetLocalPlayerSlot(std::uint8_t player_slot) {
    if (player_slot >= sim::kMaxPlayers) {
        core::Logger::Warn("app", "Ignoring invalid local player slot " + std::to_string(player_slot) + ".");
        return;
    }
    if (has_local_player_slot_ && local_player_slot_ == player_slot) {
        return;
    }

    Clear();
    has_local_player_slot_ = true;
    local_player_slot_ = player_slot;
    core::Logger::Info("app", "Local player slot: " + std::to_string(player_slot + 1) + ".");
}

void ClientSession::Clear() {
    registry_.clear();
    car_entities_.fill(entt::null);
    has_local_player_slot_ = false;
    local_player_slot_ = 0;
    has_authoritative_state_ = false;
    last_authoritative_state_ = sim::CarState{};
    ball_replicator_ = sim::RemoteBallReplicator(settings_.ball);
    match_status_ = sim::MatchStatus{};
    last_target_tick_ = sim::kInvalidTick;
    clock_.Reset();
}

void ClientSession::AccumulateInput(const sim::InputFrame& frame) {
    sim::LocallyPredicted* local = LocalRole();
    if (local == nullptr) {
        return;
    }
    local->prediction->AccumulateInput(frame);
}

void ClientSession::ReceiveOwnerState(const sim::CarState& state) {
    if (!has_local_player_slot_ || state.tick == sim::kInvalidTick) {
        return;
    }

    has_authoritative_state_ = true;
    last_authoritative_state_ = state;
    sim::LocallyPredicted* local = LocalRole();
    if (local == nullptr) {
        SpawnLocalCar(state);
        return;
    }
    local->reconciler->QueueAuthoritativeState(state);
}

void ClientSession::ReceiveRemoteCar(std::uint8_t player_slot, const sim::RemoteCarSnapshot& snapshot) {
    if (player_slot >= sim::kMaxPlayers) {
        return;
    }
    if (has_local_player_slot_ && player_slot == local_player_slot_) {
        ++diagnostics_.ignored_own_remote_count;
        return;
    }

    entt::entity car = car_entities_[player_slot];
    if (car == entt::null) {
        car = registry_.create();
        registry_.emplace<sim::PlayerSlot>(car, sim::PlayerSlot{.value = player_slot});
        registry_.emplace<sim::CarRole>(
            car,
            sim::RemoteReplicated{
                .replicator = std::make_unique<sim::RemoteCarReplicator>(settings_.remote_car),
            });
        car_entities_[player_slot] = car;
    }

    auto* role = std::get_if<sim::RemoteReplicated>(&registry_.get<sim::CarRole>(car));
    if (role == nullptr || !role->replicator->PushSnapshot(snapshot)) {
        ++diagnostics_.stale_remote_snapshot_count;
    }
}

void ClientSession::ReceiveBallState(const sim::BallState& ball) {
    if (!ball_replicator_.PushSnapshot(ball)) {
        ++diagnostics_.stale_ball_snapshot_count;
    }
}

void ClientSession::ReceiveMatchStatus(const sim::MatchStatus& status) {
    if (match_status_.tick != sim::kInvalidTick && status.tick < match_status_.tick) {
        return;
    }
    match_status_ = status;
}

void ClientSession::AdvanceRender(double frame_seconds) {
    if (frame_seconds <= 0.0) {
        return;
    }

    ball_replicator_.Advance(frame_seconds);
    auto remote_view = registry_.view<sim::CarRole>();
    for (const entt::entity car : remote_view) {
        auto* role = std::get_if<sim::RemoteReplicated>(&remote_view.get<sim::CarRole>(car));
        if (role != nullptr) {
            role->replicator->Advance(frame_seconds);
        }
    }
}

ClientStepResult ClientSession::Step(double fixed_delta_seconds) {
    ClientStepResult result{};
    clock_.AdvanceLocal(fixed_delta_seconds);

    sim::LocallyPredicted* local = LocalRole();
    if (local == nullptr) {
        return result;
    }
    if (time_source_ != nullptr && !clock_.IsSynchronized()) {
        ++diagnostics_.held_step_count;
        return result;
    }

    const sim::Tick target_tick = clock_.CurrentTick();
    result.target_tick = target_tick;
    last_target_tick_ = target_tick;

    const sim::Tick last_predicted = local->prediction->LastPredictedTick();
    if (target_tick > last_predicted &&
        target_tick - last_predicted > static_cast<sim::Tick>(settings_.max_catch_up_ticks)) {
        ReAnchor(target_tick);
        result.re_anchored = true;
    }

    while (local->prediction->LastPredictedTick() < target_tick) {
        const sim::PredictionStepResult step =
            local->prediction->Step(local->prediction->LastPredictedTick() + 1, fixed_delta_seconds);
        if (!step.stepped) {
            break;
        }
        ++result.predicted_tick_count;
    }

    result.reconcile = local->reconciler->ApplyPending(fixed_delta_seconds);
    return result;
}

void ClientSession::OnCarStepEvents(
    sim::Tick tick,
    const sim::CarState& state,
    const sim::CarStepEvents& events) {
    (void)state;
    if (!events.jumped && !events.landed) {
        return;
    }
    if (sim::IsResimulating()) {
        ++diagnostics_.suppressed_replay_event_count;
        return;
    }

    if (events.jumped) {
        ++diagnostics_.car_jump_event_count;
        DispatchCarEvent("car_jump", tick);
    }
    if (events.landed) {
        ++diagnostics_.car_land_event_count;
        DispatchCarEvent("car_land", tick);
    }
}

bool ClientSession::HasLocalCar() const {
    return LocalRole() != nullptr;
}

bool ClientSession::HasLocalPlayerSlot() const {
    return has_local_player_slot_;
}

std::uint8_t ClientSession::LocalPlayerSlot() const {
    return local_player_slot_;
}

const sim::CarState* ClientSession::LocalCarState() const {
    const sim::LocallyPredicted* local = LocalRole();
    return local != nullptr ? &local->prediction->State() : nullptr;
}

bool ClientSession::HasAuthoritativeState() const {
    return has_authoritative_state_;
}

const sim::CarState& ClientSession::LastAuthoritativeState() const {
    return last_authoritative_state_;
}

std::vector<CarView> ClientSession::CarViews() const {
    std::vector<CarView> views;
    auto view = registry_.view<const sim::PlayerSlot, const sim::CarRole>();
    for (const entt::entity car : view) {
        const sim::CarRole& role = view.get<const sim::CarRole>(car);
        if (const auto* remote = std::get_if<sim::RemoteReplicated>(&role);
            remote != nullptr && !remote->replicator->HasSnapshot()) {
            continue;
        }

        views.push_back(CarView{
            .player_slot = view.get<const sim::PlayerSlot>(car).value,
            .locally_predicted = std::holds_alternative<sim::LocallyPredicted>(role),
            .transform = sim::CurrentRenderTransform(role),
        });
    }
    return views;
}

bool ClientSession::HasBall() const {
    return ball_replicator_.HasSnapshot();
}

sim::RenderTransform ClientSession::BallTransform() const {
    return ball_replicator_.Transform();
}

bool ClientSession::IsBallExtrapolating() const {
    return ball_replicator_.IsExtrapolating();
}

const sim::MatchStatus& ClientSession::LatestMatchStatus() const {
    return match_status_;
}

sim::Tick ClientSession::LastTargetTick() const {
    return last_target_tick_;
}

ClientSessionDiagnostics ClientSession::DiagnosticsSnapshot() const {
    ClientSessionDiagnostics snapshot = diagnostics_;
    snapshot.local_player_slot = local_player_slot_;
    const sim::LocallyPredicted* local = LocalRole();
    snapshot.has_local_car = local != nullptr;
    if (local != nullptr) {
        snapshot.last_predicted_tick = local->prediction->LastPredictedTick();
        snapshot.prediction = local->prediction->DiagnosticsSnapshot();
        snapshot.reconcile = local->reconciler->DiagnosticsSnapshot();
    }
    return snapshot;
}

sim::LocallyPredicted* ClientSession::LocalRole() {
    if (!has_local_player_slot_ || car_entities_[local_player_slot_] == entt::null) {
        return nullptr;
    }
    return std::get_if<sim::LocallyPredicted>(&registry_.get<sim::CarRole>(car_entities_[local_player_slot_]));
}

const sim::LocallyPredicted* ClientSession::LocalRole() const {
    if (!has_local_player_slot_ || car_entities_[local_player_slot_] == entt::null) {
        return nullptr;
    }
    return std::get_if<sim::LocallyPredicted>(&registry_.get<sim::CarRole>(car_entities_[local_player_slot_]));
}

void ClientSession::SpawnLocalCar(const sim::CarState& state) {
    auto prediction = std::make_unique<sim::PredictionEngine>(
        car_physics_,
        input_sink_,
        settings_.prediction);
    prediction->SetEventListener(this);
    prediction->Reset(state);
    auto reconciler = std::make_unique<sim::Reconciler>(*prediction, settings_.reconcile);

    const entt::entity car = registry_.create();
    registry_.emplace<sim::PlayerSlot>(car, sim::PlayerSlot{.value = local_player_slot_});
    registry_.emplace<sim::CarRole>(
        car,
        sim::LocallyPredicted{
            .prediction = std::move(prediction),
            .reconciler = std::move(reconciler),
        });
    car_entities_[local_player_slot_] = car;
    core::Logger::Info("app", "Local car spawned at tick " + std::to_string(state.tick) + ".");
}

void ClientSession::ReAnchor(sim::Tick target_tick) {
    sim::LocallyPredicted* local = LocalRole();
    if (local == nullptr || target_tick == 0) {
        return;
    }

    const sim::Tick previous_tick = local->prediction->LastPredictedTick();
    sim::CarState state = local->prediction->State();
    state.tick = target_tick - 1;
    local->prediction->Reset(state);
    local->reconciler->Reset();
    ++diagnostics_.re_anchor_count;
    core::Logger::Info(
        "app",
        "Prediction re-anchored from tick " + std::to_string(previous_tick) +
            " to " + std::to_string(state.tick) + ".");
}

void ClientSession::DispatchCarEvent(const char* event_name, sim::Tick tick) {
    script_host_.DispatchEvent(script::ScriptEvent{
        .event_name = event_name,
        .payload = "tick=" + std::to_string(tick) + " slot=" + std::to_string(local_player_slot_),
    });
}

}  // namespace pitchsync::app

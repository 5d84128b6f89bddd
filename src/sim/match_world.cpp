#include "sim/match_world.h"

#include "core/logger.h"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

namespace pitchsync::sim {
namespace {

constexpr core::Vec3 kWorldUp{.x = 0.0F, .y = 1.0F, .z = 0.0F};

std::string ScoreText(const std::array<std::uint16_t, kMaxPlayers>& scores) {
    return std::to_string(scores[0]) + "-" + std::to_string(scores[1]);
}

}  // namespace

const char* MatchPhaseName(MatchPhase phase) {
    switch (phase) {
        case MatchPhase::WaitingForPlayers:
            return "waiting_for_players";
        case MatchPhase::Playing:
            return "playing";
        case MatchPhase::Ended:
            return "ended";
    }

    return "unknown";
}

const char* MatchEventTypeName(MatchEventType type) {
    switch (type) {
        case MatchEventType::PlayerJoined:
            return "player_joined";
        case MatchEventType::PlayerLeft:
            return "player_left";
        case MatchEventType::Kickoff:
            return "kickoff";
        case MatchEventType::BallTouch:
            return "ball_touch";
        case MatchEventType::Goal:
            return "goal";
        case MatchEventType::MatchEnd:
            return "match_end";
    }

    return "unknown";
}

MatchWorld::MatchWorld(
    const ArenaCarPhysics& car_physics,
    const BallPhysics& ball_physics,
    IMatchBroadcastSink& broadcast_sink,
    MatchSettings settings)
    : car_physics_(car_physics),
      ball_physics_(ball_physics),
      broadcast_sink_(broadcast_sink),
      settings_(settings),
      ball_(ball_physics.MakeSpawnedBall(0)) {}

bool MatchWorld::AddPlayer(std::uint8_t player_slot, Tick tick) {
    if (player_slot >= kMaxPlayers || car_entities_[player_slot] != entt::null) {
        return false;
    }

    auto engine = std::make_unique<AuthoritativeSimEngine>(
        player_slot,
        car_physics_,
        broadcast_sink_,
        settings_.car);
    engine->Teleport(SpawnStateFor(player_slot, tick));

    const entt::entity car = registry_.create();
    registry_.emplace<PlayerSlot>(car, PlayerSlot{.value = player_slot});
    registry_.emplace<CarRole>(car, ServerAuthoritative{.engine = std::move(engine)});
    registry_.emplace<BallContact>(car);
    car_entities_[player_slot] = car;

    PushEvent(MatchEventType::PlayerJoined, tick, player_slot);
    core::Logger::Info("match", "Player " + std::to_string(player_slot + 1) + " joined.");

    if (PlayerCount() == kMaxPlayers && phase_ != MatchPhase::Playing) {
        phase_ = MatchPhase::Playing;
        elapsed_match_seconds_ = 0.0;
        scores_ = {0, 0};
        core::Logger::Info("match", "Both players present, match started.");
        Kickoff(tick);
    }

    status_dirty_ = true;
    return true;
}

void MatchWorld::RemovePlayer(std::uint8_t player_slot, Tick tick) {
    if (player_slot >= kMaxPlayers || car_entities_[player_slot] == entt::null) {
        return;
    }

    registry_.destroy(car_entities_[player_slot]);
    car_entities_[player_slot] = entt::null;
    PushEvent(MatchEventType::PlayerLeft, tick, player_slot);
    core::Logger::Info("match", "Player " + std::to_string(player_slot + 1) + " left.");

    if (phase_ == MatchPhase::Playing) {
        phase_ = MatchPhase::WaitingForPlayers;
        core::Logger::Info("match", "Match paused, waiting for players.");
    }
    status_dirty_ = true;
}

bool MatchWorld::HasPlayer(std::uint8_t player_slot) const {
    return player_slot < kMaxPlayers && car_entities_[player_slot] != entt::null;
}

std::size_t MatchWorld::PlayerCount() const {
    return static_cast<std::size_t>(std::count_if(
        car_entities_.begin(),
        car_entities_.end(),
        [](entt::entity entity) { return entity != entt::null; }));
}

bool MatchWorld::ReceiveInput(std::uint8_t player_slot, const InputSample& input) {
    AuthoritativeSimEngine* engine = MutableEngine(player_slot);
    if (engine == nullptr) {
        return false;
    }
    return engine->ReceiveInput(input);
}

void MatchWorld::Step(Tick tick, double fixed_delta_seconds) {
    if (tick == kInvalidTick || (last_tick_ != kInvalidTick && tick <= last_tick_)) {
        ++diagnostics_.skipped_duplicate_tick_count;
        return;
    }

    last_tick_ = tick;
    RunCarSystem(tick, fixed_delta_seconds);
    RunBallSystem(tick, fixed_delta_seconds);
    RunTimerSystem(tick, fixed_delta_seconds);
    RunBroadcastSystem(tick);
    ++diagnostics_.stepped_tick_count;
}

MatchStatus MatchWorld::Status() const {
    const double remaining = std::max(0.0, settings_.match_duration_seconds - elapsed_match_seconds_);
    return MatchStatus{
        .tick = last_tick_,
        .phase = phase_,
        .score_player_one = scores_[0],
        .score_player_two = scores_[1],
        .remaining_seconds = static_cast<float>(remaining),
        .kickoff_count = kickoff_count_,
    };
}

const BallState& MatchWorld::Ball() const {
    return ball_;
}

const CarState* MatchWorld::Car(std::uint8_t player_slot) const {
    const AuthoritativeSimEngine* engine = Engine(player_slot);
    return engine != nullptr ? &engine->State() : nullptr;
}

const AuthoritativeSimEngine* MatchWorld::Engine(std::uint8_t player_slot) const {
    if (!HasPlayer(player_slot)) {
        return nullptr;
    }

    const auto* role = std::get_if<ServerAuthoritative>(&registry_.get<CarRole>(car_entities_[player_slot]));
    return role != nullptr ? role->engine.get() : nullptr;
}

AuthoritativeSimEngine* MatchWorld::MutableEngine(std::uint8_t player_slot) {
    if (!HasPlayer(player_slot)) {
        return nullptr;
    }

    auto* role = std::get_if<ServerAuthoritative>(&registry_.get<CarRole>(car_entities_[player_slot]));
    return role != nullptr ? role->engine.get() : nullptr;
}

std::vector<MatchEvent> MatchWorld::ConsumeEvents() {
    std::vector<MatchEvent> events = std::move(pending_events_);
    pending_events_.clear();
    return events;
}

MatchDiagnostics MatchWorld::DiagnosticsSnapshot() const {
    MatchDiagnostics snapshot = diagnostics_;
    snapshot.player_count = PlayerCount();
    return snapshot;
}

CarState MatchWorld::SpawnStateFor(std::uint8_t player_slot, Tick tick) const {
    const ArenaSettings& arena = car_physics_.Arena();
    // Both cars face the centre spot.
    const bool first = player_slot == 0;
    CarState state = MakeSpawnedCarState(
        tick,
        first ? arena.player_one_spawn : arena.player_two_spawn,
        first ? core::Quat{} : core::FromAxisAngle(kWorldUp, core::kPi));
    car_physics_.RefreshDerivedState(state);
    return state;
}

void MatchWorld::Kickoff(Tick tick) {
    for (std::uint8_t slot = 0; slot < kMaxPlayers; ++slot) {
        AuthoritativeSimEngine* engine = MutableEngine(slot);
        if (engine != nullptr) {
            engine->Teleport(SpawnStateFor(slot, tick));
        }
    }
    for (const entt::entity car : registry_.view<BallContact>()) {
        registry_.get<BallContact>(car).touching = false;
    }

    ball_ = ball_physics_.MakeSpawnedBall(tick);
    ++kickoff_count_;
    status_dirty_ = true;
    PushEvent(MatchEventType::Kickoff, tick, 0);
}

void MatchWorld::RunCarSystem(Tick tick, double fixed_delta_seconds) {
    auto view = registry_.view<CarRole>();
    for (const entt::entity car : view) {
        auto* role = std::get_if<ServerAuthoritative>(&view.get<CarRole>(car));
        if (role == nullptr || role->engine == nullptr) {
            continue;
        }
        role->engine->Step(tick, fixed_delta_seconds);
    }
}

void MatchWorld::RunBallSystem(Tick tick, double fixed_delta_seconds) {
    auto view = registry_.view<const PlayerSlot, const CarRole, BallContact>();
    for (const entt::entity car : view) {
        const auto* role = std::get_if<ServerAuthoritative>(&view.get<const CarRole>(car));
        if (role == nullptr || role->engine == nullptr) {
            continue;
        }

        BallContact& contact = view.get<BallContact>(car);
        const CarState& car_state = role->engine->State();
        const bool touching = ball_physics_.IsTouchingCar(car_state, ball_);
        if (touching && !contact.touching) {
            ball_physics_.ApplyCarHit(car_state, fixed_delta_seconds, ball_);
            ++diagnostics_.ball_touch_count;
            PushEvent(MatchEventType::BallTouch, tick, view.get<const PlayerSlot>(car).value);
        }
        contact.touching = touching;
    }

    const BallStepEvents ball_events = ball_physics_.Step(fixed_delta_seconds, ball_);
    ball_.tick = tick;
    if (ball_events.goal == GoalSide::None) {
        return;
    }

    if (phase_ != MatchPhase::Playing) {
        ball_ = ball_physics_.MakeSpawnedBall(tick);
        return;
    }

    // Player one defends -z, so a ball through the +z goal is theirs.
    const std::uint8_t scorer = ball_events.goal == GoalSide::PositiveZ ? 0 : 1;
    ++scores_[scorer];
    ++diagnostics_.goal_count;
    PushEvent(MatchEventType::Goal, tick, scorer);
    core::Logger::Info(
        "match",
        "Goal for player " + std::to_string(scorer + 1) + ", score " + ScoreText(scores_) + ".");
    Kickoff(tick);
}

void MatchWorld::RunTimerSystem(Tick tick, double fixed_delta_seconds) {
    if (phase_ != MatchPhase::Playing) {
        return;
    }

    elapsed_match_seconds_ += fixed_delta_seconds;
    if (elapsed_match_seconds_ < settings_.match_duration_seconds) {
        return;
    }

    phase_ = MatchPhase::Ended;
    status_dirty_ = true;
    PushEvent(MatchEventType::MatchEnd, tick, 0);
    core::Logger::Info("match", "Match ended, final score " + ScoreText(scores_) + ".");
}

void MatchWorld::RunBroadcastSystem(Tick tick) {
    if (IsSendTick(tick, settings_.ball_state_interval_ticks)) {
        broadcast_sink_.BroadcastBall(ball_);
        ++diagnostics_.ball_broadcast_count;
    }

    if (status_dirty_ || IsSendTick(tick, settings_.status_interval_ticks)) {
        broadcast_sink_.BroadcastMatchStatus(Status());
        ++diagnostics_.status_broadcast_count;
        status_dirty_ = false;
    }
}

void MatchWorld::PushEvent(MatchEventType type, Tick tick, std::uint8_t player_slot) {
    pending_events_.push_back(MatchEvent{
        .type = type,
        .tick = tick,
        .player_slot = player_slot,
        .score_player_one = scores_[0],
        .score_player_two = scores_[1],
    });
}

}  // namespace pitchsync::sim

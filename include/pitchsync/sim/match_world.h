#pragma once

#include "sim/authoritative_sim_engine.h"
#include "sim/ball_physics.h"
#include "sim/car_physics.h"
#include "sim/entity_role.h"

#include <entt/entt.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace pitchsync::sim {

inline constexpr std::uint8_t kMaxPlayers = 2;

enum class MatchPhase : std::uint8_t {
    WaitingForPlayers = 0,
    Playing = 1,
    Ended = 2,
};

const char* MatchPhaseName(MatchPhase phase);

// Match-level state sent to every client.
struct MatchStatus final {
    Tick tick = kInvalidTick;
    MatchPhase phase = MatchPhase::WaitingForPlayers;
    std::uint16_t score_player_one = 0;
    std::uint16_t score_player_two = 0;
    float remaining_seconds = 0.0F;
    std::uint32_t kickoff_count = 0;
};

enum class MatchEventType : std::uint8_t {
    PlayerJoined = 0,
    PlayerLeft = 1,
    Kickoff = 2,
    BallTouch = 3,
    Goal = 4,
    MatchEnd = 5,
};

const char* MatchEventTypeName(MatchEventType type);

struct MatchEvent final {
    MatchEventType type = MatchEventType::Kickoff;
    Tick tick = kInvalidTick;
    std::uint8_t player_slot = 0;
    std::uint16_t score_player_one = 0;
    std::uint16_t score_player_two = 0;
};

// Outbound side of the match: per-car state plus ball and match status.
class IMatchBroadcastSink : public ICarStateSink {
public:
    virtual void BroadcastBall(const BallState& ball) = 0;
    virtual void BroadcastMatchStatus(const MatchStatus& status) = 0;
};

struct MatchSettings final {
    AuthoritativeSimSettings car{};
    int ball_state_interval_ticks = 6;
    int status_interval_ticks = 30;
    double match_duration_seconds = 180.0;
};

struct MatchDiagnostics final {
    std::size_t player_count = 0;
    std::uint64_t stepped_tick_count = 0;
    std::uint64_t skipped_duplicate_tick_count = 0;
    std::uint64_t ball_touch_count = 0;
    std::uint64_t goal_count = 0;
    std::uint64_t ball_broadcast_count = 0;
    std::uint64_t status_broadcast_count = 0;
};

// Server-side match: two authoritative cars, the ball, goals and the timer.
class MatchWorld final {
public:
    MatchWorld(
        const ArenaCarPhysics& car_physics,
        const BallPhysics& ball_physics,
        IMatchBroadcastSink& broadcast_sink,
        MatchSettings settings);

    // Slots are 0 and 1. The match starts with a kickoff when both are filled.
    bool AddPlayer(std::uint8_t player_slot, Tick tick);
    void RemovePlayer(std::uint8_t player_slot, Tick tick);
    bool HasPlayer(std::uint8_t player_slot) const;
    std::size_t PlayerCount() const;

    bool ReceiveInput(std::uint8_t player_slot, const InputSample& input);

    void Step(Tick tick, double fixed_delta_seconds);

    MatchStatus Status() const;
    const BallState& Ball() const;
    const CarState* Car(std::uint8_t player_slot) const;
    const AuthoritativeSimEngine* Engine(std::uint8_t player_slot) const;
    std::vector<MatchEvent> ConsumeEvents();
    MatchDiagnostics DiagnosticsSnapshot() const;

private:
    AuthoritativeSimEngine* MutableEngine(std::uint8_t player_slot);
    CarState SpawnStateFor(std::uint8_t player_slot, Tick tick) const;
    void Kickoff(Tick tick);
    void RunCarSystem(Tick tick, double fixed_delta_seconds);
    void RunBallSystem(Tick tick, double fixed_delta_seconds);
    void RunTimerSystem(Tick tick, double fixed_delta_seconds);
    void RunBroadcastSystem(Tick tick);
    void PushEvent(MatchEventType type, Tick tick, std::uint8_t player_slot);

    const ArenaCarPhysics& car_physics_;
    const BallPhysics& ball_physics_;
    IMatchBroadcastSink& broadcast_sink_;
    MatchSettings settings_{};
    entt::registry registry_{};
    std::array<entt::entity, kMaxPlayers> car_entities_{entt::null, entt::null};
    BallState ball_{};
    MatchPhase phase_ = MatchPhase::WaitingForPlayers;
    std::array<std::uint16_t, kMaxPlayers> scores_{0, 0};
    double elapsed_match_seconds_ = 0.0;
    std::uint32_t kickoff_count_ = 0;
    bool status_dirty_ = true;
    Tick last_tick_ = kInvalidTick;
    std::vector<MatchEvent> pending_events_{};
    MatchDiagnostics diagnostics_{};
};

}  // namespace pitchsync::sim

#include "sim/match_world.h"

#include <cstdint>
#include <iostream>
#include <vector>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

class RecordingBroadcastSink final : public pitchsync::sim::IMatchBroadcastSink {
public:
    void SendOwnerState(std::uint8_t player_slot, const pitchsync::sim::CarState& state) override {
        (void)state;
        owner_slots.push_back(player_slot);
    }

    void BroadcastRemoteCar(std::uint8_t player_slot, const pitchsync::sim::RemoteCarSnapshot& snapshot) override {
        (void)player_slot;
        (void)snapshot;
        ++remote_count;
    }

    void BroadcastBall(const pitchsync::sim::BallState& ball) override {
        balls.push_back(ball);
    }

    void BroadcastMatchStatus(const pitchsync::sim::MatchStatus& status) override {
        statuses.push_back(status);
    }

    std::vector<std::uint8_t> owner_slots;
    int remote_count = 0;
    std::vector<pitchsync::sim::BallState> balls;
    std::vector<pitchsync::sim::MatchStatus> statuses;
};

bool HasEvent(const std::vector<pitchsync::sim::MatchEvent>& events, pitchsync::sim::MatchEventType type) {
    for (const auto& event : events) {
        if (event.type == type) {
            return true;
        }
    }
    return false;
}

constexpr double kFixedDelta = 1.0 / 60.0;

bool TestJoinStartsMatch() {
    bool passed = true;
    const pitchsync::sim::ArenaCarPhysics car_physics;
    const pitchsync::sim::BallPhysics ball_physics;
    RecordingBroadcastSink sink;
    pitchsync::sim::MatchWorld world(car_physics, ball_physics, sink, pitchsync::sim::MatchSettings{});

    passed &= Expect(world.AddPlayer(0, 0), "First slot should be joinable.");
    passed &= Expect(!world.AddPlayer(0, 0), "Occupied slot should be refused.");
    passed &= Expect(!world.AddPlayer(2, 0), "Out-of-range slot should be refused.");
    passed &= Expect(world.Status().phase == pitchsync::sim::MatchPhase::WaitingForPlayers, "One player should wait.");

    const pitchsync::sim::CarState* first_car = world.Car(0);
    passed &= Expect(first_car != nullptr && first_car->position.z == -20.0F, "Slot 0 should spawn on the -z half.");
    passed &= Expect(first_car != nullptr && first_car->can_drive, "Spawned car should rest on its wheels.");

    passed &= Expect(world.AddPlayer(1, 0), "Second slot should be joinable.");
    const auto status = world.Status();
    passed &= Expect(status.phase == pitchsync::sim::MatchPhase::Playing, "Two players should start the match.");
    passed &= Expect(status.kickoff_count == 1, "Match start should kick off.");

    const auto events = world.ConsumeEvents();
    passed &= Expect(events.size() == 3, "Two joins and a kickoff should be reported.");
    passed &= Expect(HasEvent(events, pitchsync::sim::MatchEventType::Kickoff), "Kickoff event should be reported.");
    passed &= Expect(world.ConsumeEvents().empty(), "Consumed events should not be reported twice.");

    for (pitchsync::sim::Tick tick = 1; tick <= 6; ++tick) {
        world.Step(tick, kFixedDelta);
    }
    passed &= Expect(sink.statuses.size() == 1, "Pending status should go out on the next step only.");
    passed &= Expect(sink.balls.size() == 1 && sink.balls[0].tick == 6, "Ball should go out every sixth tick.");
    passed &= Expect(sink.owner_slots.size() == 6, "Both cars should send owner state every second tick.");
    passed &= Expect(sink.remote_count == 2, "Both cars should broadcast on the sixth tick.");

    world.Step(6, kFixedDelta);
    passed &= Expect(world.DiagnosticsSnapshot().skipped_duplicate_tick_count == 1, "Repeated tick should be skipped.");

    pitchsync::sim::InputSample input = pitchsync::sim::NeutralInput(7);
    input.throttle = 1.0F;
    passed &= Expect(world.ReceiveInput(1, input), "Input should reach a present car.");
    world.Step(7, kFixedDelta);
    const pitchsync::sim::CarState* second_car = world.Car(1);
    passed &= Expect(
        second_car != nullptr && second_car->linear_velocity.z < 0.0F,
        "Slot 1 faces the centre and should drive toward -z.");
    return passed;
}

bool TestLeaveAndTimer() {
    bool passed = true;
    const pitchsync::sim::ArenaCarPhysics car_physics;
    const pitchsync::sim::BallPhysics ball_physics;
    RecordingBroadcastSink sink;
    pitchsync::sim::MatchSettings settings{};
    settings.match_duration_seconds = 0.1;
    pitchsync::sim::MatchWorld world(car_physics, ball_physics, sink, settings);

    world.AddPlayer(0, 0);
    world.AddPlayer(1, 0);
    world.ConsumeEvents();

    bool ended = false;
    for (pitchsync::sim::Tick tick = 1; tick <= 10 && !ended; ++tick) {
        world.Step(tick, kFixedDelta);
        ended = world.Status().phase == pitchsync::sim::MatchPhase::Ended;
    }
    passed &= Expect(ended, "Match should end when the timer runs out.");
    passed &= Expect(world.Status().remaining_seconds == 0.0F, "Ended match should have no time left.");
    passed &= Expect(
        HasEvent(world.ConsumeEvents(), pitchsync::sim::MatchEventType::MatchEnd),
        "Match end should be reported.");

    world.RemovePlayer(1, 20);
    passed &= Expect(!world.HasPlayer(1), "Removed player should be gone.");
    passed &= Expect(world.PlayerCount() == 1, "One player should remain.");
    passed &= Expect(world.Car(1) == nullptr, "Removed car should not be readable.");
    passed &= Expect(
        !world.ReceiveInput(1, pitchsync::sim::NeutralInput(21)),
        "Input for an empty slot should be refused.");
    passed &= Expect(
        HasEvent(world.ConsumeEvents(), pitchsync::sim::MatchEventType::PlayerLeft),
        "Leaving should be reported.");

    world.AddPlayer(1, 30);
    passed &= Expect(
        world.Status().phase == pitchsync::sim::MatchPhase::Playing,
        "Rejoining should start a fresh match.");
    passed &= Expect(world.Status().kickoff_count == 2, "Fresh match should kick off again.");

    world.RemovePlayer(0, 31);
    passed &= Expect(
        world.Status().phase == pitchsync::sim::MatchPhase::WaitingForPlayers,
        "Leaving mid-match should pause it.");
    return passed;
}

}  // namespace

int main() {
    bool passed = true;
    passed &= TestJoinStartsMatch();
    passed &= TestLeaveAndTimer();

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] pitchsync_match_world_tests\n";
    return 0;
}

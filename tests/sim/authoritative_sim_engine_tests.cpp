#include "sim/authoritative_sim_engine.h"

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

class LinearCarPhysics final : public pitchsync::sim::ICarPhysics {
public:
    pitchsync::sim::CarStepEvents Step(
        const pitchsync::sim::InputSample& input,
        double fixed_delta_seconds,
        pitchsync::sim::CarState& state) const override {
        (void)fixed_delta_seconds;
        state.position.x += input.throttle;
        return pitchsync::sim::CarStepEvents{.jumped = input.jump_pressed};
    }
};

class RecordingStateSink final : public pitchsync::sim::ICarStateSink {
public:
    void SendOwnerState(std::uint8_t player_slot, const pitchsync::sim::CarState& state) override {
        owner_slots.push_back(player_slot);
        owner_states.push_back(state);
    }

    void BroadcastRemoteCar(std::uint8_t player_slot, const pitchsync::sim::RemoteCarSnapshot& snapshot) override {
        (void)player_slot;
        remote_snapshots.push_back(snapshot);
    }

    std::vector<std::uint8_t> owner_slots;
    std::vector<pitchsync::sim::CarState> owner_states;
    std::vector<pitchsync::sim::RemoteCarSnapshot> remote_snapshots;
};

pitchsync::sim::InputSample InputAt(pitchsync::sim::Tick tick, float throttle) {
    pitchsync::sim::InputSample input = pitchsync::sim::NeutralInput(tick);
    input.throttle = throttle;
    return input;
}

constexpr double kFixedDelta = 1.0 / 60.0;

bool TestNeutralBeforeFirstInput() {
    bool passed = true;
    LinearCarPhysics physics;
    RecordingStateSink sink;
    pitchsync::sim::AuthoritativeSimEngine engine(1, physics, sink, pitchsync::sim::AuthoritativeSimSettings{});

    const auto result = engine.Step(1, kFixedDelta);
    passed &= Expect(result.stepped, "Engine should step without any input.");
    passed &= Expect(
        result.input_source == pitchsync::sim::AppliedInputSource::Neutral,
        "Without input history the neutral input should be applied.");
    passed &= Expect(
        engine.Phase() == pitchsync::sim::AuthorityPhase::WaitingForFirstInput,
        "Engine should wait for the first input.");

    passed &= Expect(engine.ReceiveInput(InputAt(2, 1.0F)), "Input for the next tick should be accepted.");
    passed &= Expect(engine.Phase() == pitchsync::sim::AuthorityPhase::Driving, "First input should start driving.");
    const auto driven = engine.Step(2, kFixedDelta);
    passed &= Expect(driven.input_source == pitchsync::sim::AppliedInputSource::Fresh, "Buffered input should be fresh.");
    passed &= Expect(engine.State().position.x == 1.0F, "Fresh input should drive the car.");
    passed &= Expect(sink.owner_slots.size() == 1 && sink.owner_slots[0] == 1, "Owner state should carry the slot.");
    return passed;
}

bool TestMissingInputRepeatsLastReceived() {
    bool passed = true;
    LinearCarPhysics physics;
    RecordingStateSink sink;
    pitchsync::sim::AuthoritativeSimEngine engine(0, physics, sink, pitchsync::sim::AuthoritativeSimSettings{});

    for (pitchsync::sim::Tick tick = 1; tick <= 96; ++tick) {
        engine.ReceiveInput(InputAt(tick, 0.5F));
    }
    pitchsync::sim::InputSample last = InputAt(97, 0.8F);
    last.jump = true;
    last.jump_pressed = true;
    engine.ReceiveInput(last);

    pitchsync::sim::AuthoritativeStepResult result{};
    for (pitchsync::sim::Tick tick = 1; tick <= 100; ++tick) {
        result = engine.Step(tick, kFixedDelta);
        if (tick == 97) {
            passed &= Expect(result.events.jumped, "Jump edge should fire on its own tick.");
        }
    }

    passed &= Expect(
        result.input_source == pitchsync::sim::AppliedInputSource::StaleRepeat,
        "Tick without input should repeat the last received input.");
    passed &= Expect(result.applied_input.tick == 97, "Repeated input should be the one from tick 97.");
    passed &= Expect(result.applied_input.throttle == 0.8F, "Repeated input should keep its controls.");
    passed &= Expect(result.applied_input.jump, "Held jump should be repeated.");
    passed &= Expect(!result.applied_input.jump_pressed, "Jump press edge should not repeat.");
    passed &= Expect(!result.events.jumped, "Repeated input should not jump again.");

    const auto diagnostics = engine.DiagnosticsSnapshot();
    passed &= Expect(diagnostics.fresh_input_count == 97, "Fresh ticks should be counted.");
    passed &= Expect(diagnostics.stale_repeat_input_count == 3, "Repeated ticks should be counted.");
    passed &= Expect(diagnostics.last_received_input_tick == 97, "Newest received tick should be reported.");
    return passed;
}

bool TestRejectsInputsOutsideWindow() {
    bool passed = true;
    LinearCarPhysics physics;
    RecordingStateSink sink;
    pitchsync::sim::AuthoritativeSimEngine engine(0, physics, sink, pitchsync::sim::AuthoritativeSimSettings{});

    passed &= Expect(!engine.ReceiveInput(pitchsync::sim::NeutralInput(pitchsync::sim::kInvalidTick)), "Unstamped input should be rejected.");

    for (pitchsync::sim::Tick tick = 1; tick <= 100; ++tick) {
        engine.Step(tick, kFixedDelta);
    }

    passed &= Expect(!engine.ReceiveInput(InputAt(100, 1.0F)), "Input for a processed tick should be rejected.");
    passed &= Expect(!engine.ReceiveInput(InputAt(40, 1.0F)), "Old input should be rejected.");
    passed &= Expect(engine.ReceiveInput(InputAt(101, 1.0F)), "Input for the next tick should be accepted.");
    passed &= Expect(engine.ReceiveInput(InputAt(100 + 1023, 1.0F)), "Input at the edge of the window should be accepted.");
    passed &= Expect(!engine.ReceiveInput(InputAt(100 + 1024, 1.0F)), "Input beyond the window should be rejected.");

    const auto diagnostics = engine.DiagnosticsSnapshot();
    passed &= Expect(diagnostics.rejected_input_count == 4, "Rejected inputs should be counted.");
    passed &= Expect(diagnostics.received_input_count == 2, "Accepted inputs should be counted.");
    passed &= Expect(engine.LastReceivedInputTick() == 1123, "Newest accepted tick should be tracked.");
    return passed;
}

bool TestSendCadence() {
    bool passed = true;
    LinearCarPhysics physics;
    RecordingStateSink sink;
    pitchsync::sim::AuthoritativeSimEngine engine(
        0,
        physics,
        sink,
        pitchsync::sim::AuthoritativeSimSettings{
            .owner_state_interval_ticks = 2,
            .remote_state_interval_ticks = 6,
        });

    for (pitchsync::sim::Tick tick = 1; tick <= 12; ++tick) {
        engine.Step(tick, kFixedDelta);
    }
    passed &= Expect(sink.owner_states.size() == 6, "Owner state should go out every second tick.");
    passed &= Expect(sink.owner_states.front().tick == 2, "First owner state should be stamped tick 2.");
    passed &= Expect(sink.remote_snapshots.size() == 2, "Remote snapshots should go out every sixth tick.");
    passed &= Expect(
        sink.remote_snapshots[0].tick == 6 && sink.remote_snapshots[1].tick == 12,
        "Remote snapshots should be stamped with their tick.");
    passed &= Expect(engine.StateBuffer().Contains(12), "Sent states should be kept in history.");
    passed &= Expect(!engine.StateBuffer().Contains(11), "Unsent states should not be kept.");

    const auto repeated = engine.Step(12, kFixedDelta);
    passed &= Expect(!repeated.stepped, "A tick should never be processed twice.");
    passed &= Expect(engine.DiagnosticsSnapshot().skipped_duplicate_tick_count == 1, "Duplicate tick should be counted.");

    pitchsync::sim::CarState placed = pitchsync::sim::MakeSpawnedCarState(12, {}, {});
    placed.position.x = 30.0F;
    engine.Teleport(placed);
    passed &= Expect(engine.State().position.x == 30.0F, "Teleport should place the car.");
    passed &= Expect(!engine.StateBuffer().Contains(12), "Teleport should clear the state history.");
    return passed;
}

}  // namespace

int main() {
    bool passed = true;
    passed &= TestNeutralBeforeFirstInput();
    passed &= TestMissingInputRepeatsLastReceived();
    passed &= TestRejectsInputsOutsideWindow();
    passed &= TestSendCadence();

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] pitchsync_authoritative_sim_engine_tests\n";
    return 0;
}

#include "sim/authoritative_sim_engine.h"
#include "sim/car_physics.h"
#include "sim/prediction_engine.h"
#include "sim/reconciler.h"
#include "sim/resimulation_scope.h"

#include <cmath>
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

bool NearlyEqual(float lhs, float rhs) {
    return std::fabs(lhs - rhs) < 1e-4F;
}

// Moves one metre along +x per tick at full throttle.
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

class RecordingInputSink final : public pitchsync::sim::IInputSink {
public:
    void SendInput(const pitchsync::sim::InputSample& input) override {
        sent.push_back(input);
    }

    std::vector<pitchsync::sim::InputSample> sent;
};

class ResimulationProbe final : public pitchsync::sim::ICarEventListener {
public:
    void OnCarStepEvents(
        pitchsync::sim::Tick tick,
        const pitchsync::sim::CarState& state,
        const pitchsync::sim::CarStepEvents& events) override {
        (void)state;
        (void)events;
        if (pitchsync::sim::IsResimulating()) {
            replayed_ticks.push_back(tick);
        } else {
            live_ticks.push_back(tick);
        }
    }

    std::vector<pitchsync::sim::Tick> live_ticks;
    std::vector<pitchsync::sim::Tick> replayed_ticks;
};

constexpr double kFixedDelta = 1.0 / 60.0;

struct Rig final {
    LinearCarPhysics physics;
    RecordingInputSink sink;
    pitchsync::sim::PredictionEngine prediction{physics, sink, pitchsync::sim::PredictionSettings{}};
    pitchsync::sim::Reconciler reconciler{prediction, pitchsync::sim::ReconcileSettings{}};

    // Predicts ticks 1..last_tick from x = 0 at the given throttle.
    void PredictTo(pitchsync::sim::Tick last_tick, float throttle) {
        prediction.Reset(pitchsync::sim::MakeSpawnedCarState(0, {}, {}));
        pitchsync::sim::InputFrame frame{};
        frame.throttle = throttle;
        for (pitchsync::sim::Tick tick = 1; tick <= last_tick; ++tick) {
            prediction.AccumulateInput(frame);
            prediction.Step(tick, kFixedDelta);
        }
    }
};

pitchsync::sim::CarState AuthoritativeAt(pitchsync::sim::Tick tick, float x) {
    pitchsync::sim::CarState state = pitchsync::sim::MakeSpawnedCarState(tick, {}, {});
    state.position.x = x;
    return state;
}

bool TestSmallErrorIsAccepted() {
    bool passed = true;
    Rig rig;
    rig.PredictTo(12, 1.0F);

    const auto result = rig.reconciler.Reconcile(AuthoritativeAt(10, 10.3F), kFixedDelta);
    passed &= Expect(
        result.outcome == pitchsync::sim::ReconcileOutcome::WithinTolerance,
        "Error below the threshold should not correct.");
    passed &= Expect(NearlyEqual(result.position_error, 0.3F), "Position error should be measured at the snapshot tick.");
    passed &= Expect(rig.prediction.State().position.x == 12.0F, "Accepted snapshot should leave the live state alone.");
    passed &= Expect(result.resimulated_tick_count == 0, "Accepted snapshot should not replay.");
    return passed;
}

bool TestModerateErrorBlends() {
    bool passed = true;
    Rig rig;
    rig.PredictTo(12, 1.0F);

    const auto result = rig.reconciler.Reconcile(AuthoritativeAt(10, 10.8F), kFixedDelta);
    passed &= Expect(result.outcome == pitchsync::sim::ReconcileOutcome::Blended, "Moderate error should blend.");
    passed &= Expect(result.resimulated_tick_count == 2, "Ticks 11 and 12 should be replayed.");
    // Replay reaches 12.8; the live car moves 70% of the way from 12.0.
    passed &= Expect(NearlyEqual(rig.prediction.State().position.x, 12.56F), "Live state should be the blended pose.");
    passed &= Expect(rig.prediction.State().tick == 12, "Blended state should stay on the current tick.");

    const pitchsync::sim::CarState* corrected = rig.prediction.StateBuffer().Find(10);
    passed &= Expect(
        corrected != nullptr && corrected->position.x == 10.8F,
        "Snapshot tick should hold the authoritative state after correction.");

    // The same snapshot delivered again now matches the corrected history.
    const auto repeated = rig.reconciler.Reconcile(AuthoritativeAt(10, 10.8F), kFixedDelta);
    passed &= Expect(
        repeated.outcome == pitchsync::sim::ReconcileOutcome::WithinTolerance,
        "Reconciling the same snapshot twice should not correct again.");
    passed &= Expect(NearlyEqual(rig.prediction.State().position.x, 12.56F), "Redelivery should not move the car.");
    return passed;
}

bool TestLargeErrorSnaps() {
    bool passed = true;
    Rig rig;
    rig.PredictTo(12, 0.0F);

    const auto result = rig.reconciler.Reconcile(AuthoritativeAt(10, 5.0F), kFixedDelta);
    passed &= Expect(result.outcome == pitchsync::sim::ReconcileOutcome::Snapped, "Large error should snap.");
    passed &= Expect(rig.prediction.State().position.x == 5.0F, "Snap should take the replayed pose unblended.");
    return passed;
}

bool TestThresholdBoundaries() {
    bool passed = true;

    Rig at_snap;
    at_snap.PredictTo(12, 1.0F);
    const auto snapped = at_snap.reconciler.Reconcile(AuthoritativeAt(10, 13.0F), kFixedDelta);
    passed &= Expect(snapped.position_error == 3.0F, "Boundary error should be exactly the snap threshold.");
    passed &= Expect(
        snapped.outcome == pitchsync::sim::ReconcileOutcome::Snapped,
        "Error equal to the snap threshold should snap.");
    passed &= Expect(at_snap.prediction.State().position.x == 15.0F, "Snap should replay from the corrected tick.");

    Rig at_tolerance;
    at_tolerance.PredictTo(12, 1.0F);
    const auto tolerated = at_tolerance.reconciler.Reconcile(AuthoritativeAt(10, 10.5F), kFixedDelta);
    passed &= Expect(
        tolerated.outcome == pitchsync::sim::ReconcileOutcome::WithinTolerance,
        "Error equal to the tolerance should be accepted.");
    return passed;
}

bool TestMissingHistoryIsDiscarded() {
    bool passed = true;
    Rig rig;
    rig.PredictTo(12, 1.0F);

    const auto result = rig.reconciler.Reconcile(AuthoritativeAt(40, 3.0F), kFixedDelta);
    passed &= Expect(
        result.outcome == pitchsync::sim::ReconcileOutcome::Discarded,
        "Snapshot without a predicted counterpart should be discarded.");
    passed &= Expect(rig.prediction.State().position.x == 12.0F, "Discarded snapshot should not touch the state.");
    passed &= Expect(rig.reconciler.DiagnosticsSnapshot().discarded_count == 1, "Discard should be counted.");
    return passed;
}

bool TestCycledHistoryIsDiscarded() {
    bool passed = true;
    LinearCarPhysics physics;
    RecordingInputSink sink;
    pitchsync::sim::PredictionEngine prediction(
        physics,
        sink,
        pitchsync::sim::PredictionSettings{.buffer_capacity = 8});
    pitchsync::sim::Reconciler reconciler(prediction, pitchsync::sim::ReconcileSettings{});

    prediction.Reset(pitchsync::sim::MakeSpawnedCarState(0, {}, {}));
    pitchsync::sim::InputFrame frame{};
    frame.throttle = 1.0F;
    for (pitchsync::sim::Tick tick = 1; tick <= 20; ++tick) {
        prediction.AccumulateInput(frame);
        prediction.Step(tick, kFixedDelta);
    }
    passed &= Expect(prediction.StateBuffer().StampAt(5) == 13, "Slot of tick 5 should have been reused by tick 13.");

    const auto result = reconciler.Reconcile(AuthoritativeAt(5, 40.0F), kFixedDelta);
    passed &= Expect(
        result.outcome == pitchsync::sim::ReconcileOutcome::Discarded,
        "Snapshot older than the buffered history should be discarded.");
    passed &= Expect(result.resimulated_tick_count == 0, "Discarded snapshot should not replay.");
    passed &= Expect(prediction.State().position.x == 20.0F, "Discarded snapshot should not touch the live state.");
    passed &= Expect(prediction.State().tick == 20, "Live state should stay on the current tick.");
    passed &= Expect(
        prediction.StateBuffer().Find(13) != nullptr && prediction.StateBuffer().Find(13)->position.x == 13.0F,
        "Buffered history should be left intact.");
    return passed;
}

bool TestQueueKeepsNewestAndDropsStale() {
    bool passed = true;
    Rig rig;
    rig.PredictTo(12, 1.0F);

    passed &= Expect(
        rig.reconciler.ApplyPending(kFixedDelta).outcome == pitchsync::sim::ReconcileOutcome::NothingPending,
        "Empty queue should report nothing pending.");

    rig.reconciler.QueueAuthoritativeState(AuthoritativeAt(8, 8.0F));
    rig.reconciler.QueueAuthoritativeState(AuthoritativeAt(10, 10.0F));
    rig.reconciler.QueueAuthoritativeState(AuthoritativeAt(6, 6.0F));
    const auto applied = rig.reconciler.ApplyPending(kFixedDelta);
    passed &= Expect(applied.snapshot_tick == 10, "Only the newest queued snapshot should be applied.");
    passed &= Expect(!rig.reconciler.HasPending(), "Applying should empty the queue.");

    rig.reconciler.QueueAuthoritativeState(AuthoritativeAt(8, 8.0F));
    passed &= Expect(!rig.reconciler.HasPending(), "Snapshots older than the last reconciled tick should be dropped.");
    rig.reconciler.QueueAuthoritativeState(AuthoritativeAt(10, 10.0F));
    passed &= Expect(rig.reconciler.HasPending(), "The last reconciled tick may be delivered again.");

    const auto diagnostics = rig.reconciler.DiagnosticsSnapshot();
    passed &= Expect(diagnostics.superseded_snapshot_count == 1, "Superseded snapshot should be counted.");
    passed &= Expect(diagnostics.stale_snapshot_drop_count == 2, "Stale snapshots should be counted.");
    passed &= Expect(diagnostics.last_reconciled_tick == 10, "Last reconciled tick should be reported.");

    rig.reconciler.Reset();
    passed &= Expect(!rig.reconciler.HasPending(), "Reset should clear the queue.");
    rig.reconciler.QueueAuthoritativeState(AuthoritativeAt(2, 2.0F));
    passed &= Expect(rig.reconciler.HasPending(), "Reset should forget the last reconciled tick.");
    return passed;
}

bool TestReplayRaisesResimulationFlag() {
    bool passed = true;
    Rig rig;
    ResimulationProbe probe;
    rig.prediction.SetEventListener(&probe);
    rig.PredictTo(12, 1.0F);

    passed &= Expect(probe.live_ticks.size() == 12, "Live steps should report events outside resimulation.");
    rig.reconciler.Reconcile(AuthoritativeAt(9, 5.0F), kFixedDelta);
    passed &= Expect(probe.replayed_ticks.size() == 3, "Replayed ticks should report events while resimulating.");
    passed &= Expect(
        probe.replayed_ticks.front() == 10 && probe.replayed_ticks.back() == 12,
        "Replay should cover the ticks after the snapshot.");
    passed &= Expect(!pitchsync::sim::IsResimulating(), "Flag should be cleared after the replay.");
    passed &= Expect(probe.live_ticks.size() == 12, "Replay must not be reported as live steps.");

    {
        const pitchsync::sim::ResimulationScope outer;
        {
            const pitchsync::sim::ResimulationScope inner;
        }
        passed &= Expect(pitchsync::sim::IsResimulating(), "Nested scope should restore the outer value.");
    }
    passed &= Expect(!pitchsync::sim::IsResimulating(), "Outer scope should clear the flag.");
    rig.prediction.SetEventListener(nullptr);
    return passed;
}

bool TestReplayConvergesOnServerState() {
    bool passed = true;
    using pitchsync::sim::Tick;

    const pitchsync::sim::ArenaCarPhysics physics;
    const pitchsync::sim::ArenaSettings& arena = physics.Arena();
    pitchsync::sim::CarState spawn =
        pitchsync::sim::MakeSpawnedCarState(0, arena.player_one_spawn, pitchsync::core::Quat{});
    physics.RefreshDerivedState(spawn);

    RecordingInputSink client_sink;
    pitchsync::sim::PredictionEngine prediction(physics, client_sink, pitchsync::sim::PredictionSettings{});
    pitchsync::sim::Reconciler reconciler(
        prediction,
        pitchsync::sim::ReconcileSettings{
            .position_error_threshold = 0.0F,
            .rotation_error_threshold_deg = 0.0F,
            .hard_snap_threshold = 0.0F,
            .correction_blend = 0.7F,
        });
    prediction.Reset(spawn);

    pitchsync::sim::InputFrame frame{};
    frame.throttle = 1.0F;
    frame.steer = 0.3F;
    for (Tick tick = 1; tick <= 20; ++tick) {
        frame.jump = tick >= 8 && tick <= 12;
        prediction.AccumulateInput(frame);
        prediction.Step(tick, kFixedDelta);
    }
    passed &= Expect(client_sink.sent.size() == 20, "Every predicted input should have been sent.");

    // The server disagrees about tick 5 only.
    struct OwnerStates final : pitchsync::sim::ICarStateSink {
        void SendOwnerState(std::uint8_t, const pitchsync::sim::CarState& state) override {
            states.push_back(state);
        }
        void BroadcastRemoteCar(std::uint8_t, const pitchsync::sim::RemoteCarSnapshot&) override {}
        std::vector<pitchsync::sim::CarState> states;
    } server_sink;
    pitchsync::sim::AuthoritativeSimEngine server(0, physics, server_sink, pitchsync::sim::AuthoritativeSimSettings{});
    server.Teleport(spawn);
    for (pitchsync::sim::InputSample input : client_sink.sent) {
        if (input.tick == 5) {
            input.throttle = -1.0F;
        }
        server.ReceiveInput(input);
    }
    std::vector<pitchsync::sim::CarState> server_states;
    for (Tick tick = 1; tick <= 20; ++tick) {
        server.Step(tick, kFixedDelta);
        server_states.push_back(server.State());
    }

    const auto result = reconciler.Reconcile(server_states[9], kFixedDelta);
    passed &= Expect(result.outcome == pitchsync::sim::ReconcileOutcome::Snapped, "Diverged prediction should be corrected.");
    passed &= Expect(result.resimulated_tick_count == 10, "Ticks 11 through 20 should be replayed.");

    bool every_tick_matches = true;
    for (Tick tick = 11; tick <= 19; ++tick) {
        const pitchsync::sim::CarState* replayed = prediction.StateBuffer().Find(tick);
        const pitchsync::sim::CarState& expected = server_states[tick - 1];
        if (replayed == nullptr ||
            replayed->tick != expected.tick ||
            !(replayed->position == expected.position) ||
            !(replayed->rotation == expected.rotation) ||
            !(replayed->linear_velocity == expected.linear_velocity) ||
            !(replayed->angular_velocity == expected.angular_velocity) ||
            replayed->jumping != expected.jumping ||
            replayed->jump_timer != expected.jump_timer) {
            std::cerr << "Replayed tick " << tick << " differs from the server.\n";
            every_tick_matches = false;
        }
    }
    passed &= Expect(every_tick_matches, "Every replayed tick should match the server state for that tick.");

    const pitchsync::sim::CarState& client = prediction.State();
    const pitchsync::sim::CarState& authoritative = server.State();
    passed &= Expect(client.tick == authoritative.tick, "Client should end on the server's tick.");
    passed &= Expect(client.position == authoritative.position, "Replay should land exactly on the server position.");
    passed &= Expect(client.rotation == authoritative.rotation, "Replay should land exactly on the server rotation.");
    passed &= Expect(
        client.linear_velocity == authoritative.linear_velocity,
        "Replay should land exactly on the server velocity.");
    return passed;
}

}  // namespace

int main() {
    bool passed = true;
    passed &= TestSmallErrorIsAccepted();
    passed &= TestModerateErrorBlends();
    passed &= TestLargeErrorSnaps();
    passed &= TestThresholdBoundaries();
    passed &= TestMissingHistoryIsDiscarded();
    passed &= TestCycledHistoryIsDiscarded();
    passed &= TestQueueKeepsNewestAndDropsStale();
    passed &= TestReplayRaisesResimulationFlag();
    passed &= TestReplayConvergesOnServerState();

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] pitchsync_reconciler_tests\n";
    return 0;
}

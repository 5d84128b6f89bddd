#pragma once

#include "sim/car_physics.h"
#include "sim/entity_state.h"
#include "sim/input_sample.h"
#include "sim/tick_ring_buffer.h"

#include <cstddef>
#include <cstdint>

namespace pitchsync::sim {

// Outbound side of the client prediction engine.
class IInputSink {
public:
    virtual ~IInputSink() = default;

    virtual void SendInput(const InputSample& input) = 0;
};

// Receives the events of every local physics step, including replayed ones.
// Listeners check IsResimulating() before firing one-shot effects.
class ICarEventListener {
public:
    virtual ~ICarEventListener() = default;

    virtual void OnCarStepEvents(Tick tick, const CarState& state, const CarStepEvents& events) = 0;
};

struct PredictionSettings final {
    int input_send_interval_ticks = 2;
    std::size_t buffer_capacity = kDefaultTickBufferCapacity;
};

struct PredictionStepResult final {
    bool stepped = false;
    InputSample input{};
    CarStepEvents events{};
    std::size_t sent_input_count = 0;
};

struct PredictionDiagnostics final {
    Tick last_predicted_tick = kInvalidTick;
    std::uint64_t predicted_tick_count = 0;
    std::uint64_t skipped_duplicate_tick_count = 0;
    std::uint64_t sent_input_count = 0;
    std::uint64_t reset_count = 0;
};

// Owner-side prediction: the local car moves on the tick its input is
// sampled, without waiting for the server.
class PredictionEngine final {
public:
    PredictionEngine(const ICarPhysics& physics, IInputSink& input_sink, PredictionSettings settings);

    // Non-owning; nullptr detaches.
    void SetEventListener(ICarEventListener* listener);

    // Drops all history and continues from `state` (forced respawn).
    void Reset(const CarState& state);

    void AccumulateInput(const InputFrame& frame);

    PredictionStepResult Step(Tick tick, double fixed_delta_seconds);

    // Steps `state` to `tick` with `input`. Used for live steps and replays
    // alike so that both report events the same way.
    CarStepEvents StepPhysics(
        Tick tick,
        const InputSample& input,
        double fixed_delta_seconds,
        CarState& state);

    const CarState& State() const;
    void SetState(const CarState& state);
    Tick LastPredictedTick() const;

    const TickRingBuffer<InputSample>& InputBuffer() const;
    const TickRingBuffer<CarState>& StateBuffer() const;
    TickRingBuffer<CarState>& MutableStateBuffer();

    PredictionDiagnostics DiagnosticsSnapshot() const;

private:
    std::size_t SendPendingInputs(Tick tick);

    const ICarPhysics& physics_;
    IInputSink& input_sink_;
    ICarEventListener* event_listener_ = nullptr;
    PredictionSettings settings_{};
    InputLatch input_latch_{};
    CarState state_{};
    TickRingBuffer<InputSample> input_buffer_;
    TickRingBuffer<CarState> state_buffer_;
    Tick last_predicted_tick_ = kInvalidTick;
    Tick last_sent_tick_ = kInvalidTick;
    PredictionDiagnostics diagnostics_{};
};

}  // namespace pitchsync::sim

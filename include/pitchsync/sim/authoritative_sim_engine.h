#pragma once

#include "sim/car_physics.h"
#include "sim/entity_state.h"
#include "sim/input_sample.h"
#include "sim/tick_ring_buffer.h"

#include <cstddef>
#include <cstdint>

namespace pitchsync::sim {

enum class AuthorityPhase : std::uint8_t {
    WaitingForFirstInput = 0,
    Driving = 1,
};

enum class AppliedInputSource : std::uint8_t {
    Fresh = 0,
    StaleRepeat = 1,
    Neutral = 2,
};

const char* AppliedInputSourceName(AppliedInputSource source);

// Outbound side of the server engine. The server net service implements it;
// tests record into vectors.
class ICarStateSink {
public:
    virtual ~ICarStateSink() = default;

    virtual void SendOwnerState(std::uint8_t player_slot, const CarState& state) = 0;
    virtual void BroadcastRemoteCar(std::uint8_t player_slot, const RemoteCarSnapshot& snapshot) = 0;
};

struct AuthoritativeSimSettings final {
    int owner_state_interval_ticks = 2;
    int remote_state_interval_ticks = 6;
    std::size_t buffer_capacity = kDefaultTickBufferCapacity;
};

struct AuthoritativeStepResult final {
    bool stepped = false;
    AppliedInputSource input_source = AppliedInputSource::Neutral;
    InputSample applied_input{};
    CarStepEvents events{};
    bool owner_state_sent = false;
    bool remote_snapshot_sent = false;
};

struct SimDiagnostics final {
    AuthorityPhase phase = AuthorityPhase::WaitingForFirstInput;
    Tick last_processed_tick = kInvalidTick;
    Tick last_received_input_tick = kInvalidTick;
    std::uint64_t stepped_tick_count = 0;
    std::uint64_t skipped_duplicate_tick_count = 0;
    std::uint64_t received_input_count = 0;
    std::uint64_t rejected_input_count = 0;
    std::uint64_t fresh_input_count = 0;
    std::uint64_t stale_repeat_input_count = 0;
    std::uint64_t neutral_input_count = 0;
    std::uint64_t owner_state_send_count = 0;
    std::uint64_t remote_snapshot_send_count = 0;
};

// Server-side authority over one car: owns its input and state history and
// decides which input is applied on every tick.
class AuthoritativeSimEngine final {
public:
    AuthoritativeSimEngine(
        std::uint8_t player_slot,
        const ICarPhysics& physics,
        ICarStateSink& state_sink,
        AuthoritativeSimSettings settings);

    // Places the car without stepping. Input history survives, state history
    // is cleared.
    void Teleport(const CarState& state);

    // Returns false for inputs that can no longer (or cannot yet) be applied.
    bool ReceiveInput(const InputSample& input);

    AuthoritativeStepResult Step(Tick tick, double fixed_delta_seconds);

    std::uint8_t PlayerSlot() const;
    AuthorityPhase Phase() const;
    const CarState& State() const;
    Tick LastProcessedTick() const;
    Tick LastReceivedInputTick() const;
    const TickRingBuffer<InputSample>& InputBuffer() const;
    const TickRingBuffer<CarState>& StateBuffer() const;
    SimDiagnostics DiagnosticsSnapshot() const;

private:
    AppliedInputSource SelectInput(Tick tick, InputSample& out_input) const;

    std::uint8_t player_slot_ = 0;
    const ICarPhysics& physics_;
    ICarStateSink& state_sink_;
    AuthoritativeSimSettings settings_{};
    AuthorityPhase phase_ = AuthorityPhase::WaitingForFirstInput;
    CarState state_{};
    TickRingBuffer<InputSample> input_buffer_;
    TickRingBuffer<CarState> state_buffer_;
    InputSample last_received_input_{};
    Tick last_processed_tick_ = kInvalidTick;
    SimDiagnostics diagnostics_{};
};

}  // namespace pitchsync::sim

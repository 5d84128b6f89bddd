#include "sim/authoritative_sim_engine.h"

namespace pitchsync::sim {

const char* AppliedInputSourceName(AppliedInputSource source) {
    switch (source) {
        case AppliedInputSource::Fresh:
            return "fresh";
        case AppliedInputSource::StaleRepeat:
            return "stale_repeat";
        case AppliedInputSource::Neutral:
            return "neutral";
    }

    return "unknown";
}

AuthoritativeSimEngine::AuthoritativeSimEngine(
    std::uint8_t player_slot,
    const ICarPhysics& physics,
    ICarStateSink& state_sink,
    AuthoritativeSimSettings settings)
    : player_slot_(player_slot),
      physics_(physics),
      state_sink_(state_sink),
      settings_(settings),
      input_buffer_(settings.buffer_capacity),
      state_buffer_(settings.buffer_capacity) {}

void AuthoritativeSimEngine::Teleport(const CarState& state) {
    state_ = state;
    state_buffer_.Clear();
}

bool AuthoritativeSimEngine::ReceiveInput(const InputSample& input) {
    if (input.tick == kInvalidTick) {
        ++diagnostics_.rejected_input_count;
        return false;
    }

    if (last_processed_tick_ != kInvalidTick) {
        // Too late to apply, or so far ahead that it would overwrite a slot
        // still needed before its own tick comes around.
        const bool too_late = input.tick <= last_processed_tick_;
        const bool too_early =
            input.tick - last_processed_tick_ >= static_cast<Tick>(input_buffer_.Capacity());
        if (too_late || too_early) {
            ++diagnostics_.rejected_input_count;
            return false;
        }
    }

    input_buffer_.Store(input.tick, input);
    ++diagnostics_.received_input_count;
    if (last_received_input_.tick == kInvalidTick || input.tick > last_received_input_.tick) {
        last_received_input_ = input;
    }
    phase_ = AuthorityPhase::Driving;
    return true;
}

AppliedInputSource AuthoritativeSimEngine::SelectInput(Tick tick, InputSample& out_input) const {
    if (input_buffer_.TryGet(tick, out_input)) {
        return AppliedInputSource::Fresh;
    }

    if (last_received_input_.tick != kInvalidTick) {
        // Continuous controls are held; press/release edges already fired once.
        out_input = last_received_input_;
        out_input.jump_pressed = false;
        out_input.jump_released = false;
        return AppliedInputSource::StaleRepeat;
    }

    out_input = NeutralInput(tick);
    return AppliedInputSource::Neutral;
}

AuthoritativeStepResult AuthoritativeSimEngine::Step(Tick tick, double fixed_delta_seconds) {
    AuthoritativeStepResult result{};
    if (tick == kInvalidTick ||
        (last_processed_tick_ != kInvalidTick && tick <= last_processed_tick_)) {
        ++diagnostics_.skipped_duplicate_tick_count;
        return result;
    }

    result.input_source = SelectInput(tick, result.applied_input);
    switch (result.input_source) {
        case AppliedInputSource::Fresh:
            ++diagnostics_.fresh_input_count;
            break;
        case AppliedInputSource::StaleRepeat:
            ++diagnostics_.stale_repeat_input_count;
            break;
        case AppliedInputSource::Neutral:
            ++diagnostics_.neutral_input_count;
            break;
    }

    result.events = physics_.Step(result.applied_input, fixed_delta_seconds, state_);
    state_.tick = tick;
    last_processed_tick_ = tick;
    result.stepped = true;
    ++diagnostics_.stepped_tick_count;

    if (IsSendTick(tick, settings_.owner_state_interval_ticks)) {
        state_buffer_.Store(tick, state_);
        state_sink_.SendOwnerState(player_slot_, state_);
        result.owner_state_sent = true;
        ++diagnostics_.owner_state_send_count;
    }

    if (IsSendTick(tick, settings_.remote_state_interval_ticks)) {
        state_sink_.BroadcastRemoteCar(player_slot_, MakeRemoteSnapshot(state_));
        result.remote_snapshot_sent = true;
        ++diagnostics_.remote_snapshot_send_count;
    }

    return result;
}

std::uint8_t AuthoritativeSimEngine::PlayerSlot() const {
    return player_slot_;
}

AuthorityPhase AuthoritativeSimEngine::Phase() const {
    return phase_;
}

const CarState& AuthoritativeSimEngine::State() const {
    return state_;
}

Tick AuthoritativeSimEngine::LastProcessedTick() const {
    return last_processed_tick_;
}

Tick AuthoritativeSimEngine::LastReceivedInputTick() const {
    return last_received_input_.tick;
}

const TickRingBuffer<InputSample>& AuthoritativeSimEngine::InputBuffer() const {
    return input_buffer_;
}

const TickRingBuffer<CarState>& AuthoritativeSimEngine::StateBuffer() const {
    return state_buffer_;
}

SimDiagnostics AuthoritativeSimEngine::DiagnosticsSnapshot() const {
    SimDiagnostics snapshot = diagnostics_;
    snapshot.phase = phase_;
    snapshot.last_processed_tick = last_processed_tick_;
    snapshot.last_received_input_tick = last_received_input_.tick;
    return snapshot;
}

}  // namespace pitchsync::sim

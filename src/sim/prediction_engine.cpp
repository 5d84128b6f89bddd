#include "sim/prediction_engine.h"

namespace pitchsync::sim {

PredictionEngine::PredictionEngine(
    const ICarPhysics& physics,
    IInputSink& input_sink,
    PredictionSettings settings)
    : physics_(physics),
      input_sink_(input_sink),
      settings_(settings),
      input_buffer_(settings.buffer_capacity),
      state_buffer_(settings.buffer_capacity) {}

void PredictionEngine::SetEventListener(ICarEventListener* listener) {
    event_listener_ = listener;
}

void PredictionEngine::Reset(const CarState& state) {
    input_buffer_.Clear();
    state_buffer_.Clear();
    input_latch_.Reset();
    state_ = state;
    last_predicted_tick_ = state.tick;
    last_sent_tick_ = state.tick;
    state_buffer_.Store(state.tick, state);
    ++diagnostics_.reset_count;
}

void PredictionEngine::AccumulateInput(const InputFrame& frame) {
    input_latch_.Accumulate(frame);
}

PredictionStepResult PredictionEngine::Step(Tick tick, double fixed_delta_seconds) {
    PredictionStepResult result{};
    if (tick == kInvalidTick ||
        (last_predicted_tick_ != kInvalidTick && tick <= last_predicted_tick_)) {
        ++diagnostics_.skipped_duplicate_tick_count;
        return result;
    }

    result.input = input_latch_.Capture(tick);
    input_buffer_.Store(tick, result.input);

    result.events = StepPhysics(tick, result.input, fixed_delta_seconds, state_);
    state_buffer_.Store(tick, state_);
    last_predicted_tick_ = tick;
    result.stepped = true;
    ++diagnostics_.predicted_tick_count;

    if (IsSendTick(tick, settings_.input_send_interval_ticks)) {
        result.sent_input_count = SendPendingInputs(tick);
    }
    return result;
}

CarStepEvents PredictionEngine::StepPhysics(
    Tick tick,
    const InputSample& input,
    double fixed_delta_seconds,
    CarState& state) {
    const CarStepEvents events = physics_.Step(input, fixed_delta_seconds, state);
    state.tick = tick;
    if (event_listener_ != nullptr) {
        event_listener_->OnCarStepEvents(tick, state, events);
    }
    return events;
}

std::size_t PredictionEngine::SendPendingInputs(Tick tick) {
    // Every sample since the previous send goes out, so ticks between send
    // ticks still reach the server with their own edges.
    Tick first = tick;
    if (last_sent_tick_ != kInvalidTick && last_sent_tick_ < tick) {
        first = last_sent_tick_ + 1;
    }
    const Tick span_limit = static_cast<Tick>(input_buffer_.Capacity());
    if (tick - first >= span_limit) {
        first = tick - span_limit + 1;
    }

    std::size_t sent = 0;
    for (Tick pending = first; pending <= tick; ++pending) {
        const InputSample* input = input_buffer_.Find(pending);
        if (input == nullptr) {
            continue;
        }
        input_sink_.SendInput(*input);
        ++sent;
    }

    last_sent_tick_ = tick;
    diagnostics_.sent_input_count += sent;
    return sent;
}

const CarState& PredictionEngine::State() const {
    return state_;
}

void PredictionEngine::SetState(const CarState& state) {
    state_ = state;
}

Tick PredictionEngine::LastPredictedTick() const {
    return last_predicted_tick_;
}

const TickRingBuffer<InputSample>& PredictionEngine::InputBuffer() const {
    return input_buffer_;
}

const TickRingBuffer<CarState>& PredictionEngine::StateBuffer() const {
    return state_buffer_;
}

TickRingBuffer<CarState>& PredictionEngine::MutableStateBuffer() {
    return state_buffer_;
}

PredictionDiagnostics PredictionEngine::DiagnosticsSnapshot() const {
    PredictionDiagnostics snapshot = diagnostics_;
    snapshot.last_predicted_tick = last_predicted_tick_;
    return snapshot;
}

}  // namespace pitchsync::sim

#include "sim/reconciler.h"

#include "core/logger.h"
#include "sim/resimulation_scope.h"

#include <algorithm>
#include <string>

namespace pitchsync::sim {

const char* ReconcileOutcomeName(ReconcileOutcome outcome) {
    switch (outcome) {
        case ReconcileOutcome::NothingPending:
            return "nothing_pending";
        case ReconcileOutcome::Discarded:
            return "discarded";
        case ReconcileOutcome::WithinTolerance:
            return "within_tolerance";
        case ReconcileOutcome::Blended:
            return "blended";
        case ReconcileOutcome::Snapped:
            return "snapped";
    }

    return "unknown";
}

Reconciler::Reconciler(PredictionEngine& prediction, ReconcileSettings settings)
    : prediction_(prediction),
      settings_(settings) {}

void Reconciler::QueueAuthoritativeState(const CarState& authoritative) {
    ++diagnostics_.received_snapshot_count;
    if (authoritative.tick == kInvalidTick ||
        (last_reconciled_tick_ != kInvalidTick && authoritative.tick < last_reconciled_tick_)) {
        ++diagnostics_.stale_snapshot_drop_count;
        return;
    }

    if (has_pending_) {
        if (authoritative.tick < pending_.tick) {
            ++diagnostics_.stale_snapshot_drop_count;
            return;
        }
        ++diagnostics_.superseded_snapshot_count;
    }

    pending_ = authoritative;
    has_pending_ = true;
}

bool Reconciler::HasPending() const {
    return has_pending_;
}

ReconcileResult Reconciler::ApplyPending(double fixed_delta_seconds) {
    if (!has_pending_) {
        return ReconcileResult{};
    }

    has_pending_ = false;
    return Reconcile(pending_, fixed_delta_seconds);
}

void Reconciler::Reset() {
    has_pending_ = false;
    pending_ = CarState{};
    last_reconciled_tick_ = kInvalidTick;
}

ReconcileResult Reconciler::Reconcile(const CarState& authoritative, double fixed_delta_seconds) {
    ReconcileResult result{
        .outcome = ReconcileOutcome::Discarded,
        .snapshot_tick = authoritative.tick,
    };

    TickRingBuffer<CarState>& state_buffer = prediction_.MutableStateBuffer();
    const CarState* predicted = state_buffer.Find(authoritative.tick);
    if (predicted == nullptr) {
        ++diagnostics_.discarded_count;
        core::Logger::Debug(
            "reconcile",
            "Discarded snapshot for tick " + std::to_string(authoritative.tick) +
                ": predicted slot holds tick " +
                std::to_string(state_buffer.StampAt(authoritative.tick)) + ".");
        return result;
    }

    last_reconciled_tick_ = authoritative.tick;
    result.position_error = core::Distance(predicted->position, authoritative.position);
    result.rotation_error_deg = core::AngleDegrees(predicted->rotation, authoritative.rotation);
    diagnostics_.last_position_error = result.position_error;
    diagnostics_.max_position_error = std::max(diagnostics_.max_position_error, result.position_error);

    if (result.position_error <= settings_.position_error_threshold &&
        result.rotation_error_deg <= settings_.rotation_error_threshold_deg) {
        result.outcome = ReconcileOutcome::WithinTolerance;
        ++diagnostics_.within_tolerance_count;
        return result;
    }

    const CarState pre_correction = prediction_.State();
    const Tick current_tick = prediction_.LastPredictedTick();
    const TickRingBuffer<InputSample>& input_buffer = prediction_.InputBuffer();

    CarState corrected = authoritative;
    state_buffer.Store(authoritative.tick, authoritative);
    {
        const ResimulationScope resimulating;
        for (Tick tick = authoritative.tick + 1;
             current_tick != kInvalidTick && tick <= current_tick;
             ++tick) {
            const InputSample* input = input_buffer.Find(tick);
            if (input == nullptr) {
                ++result.skipped_stale_input_count;
                continue;
            }
            prediction_.StepPhysics(tick, *input, fixed_delta_seconds, corrected);
            state_buffer.Store(tick, corrected);
            ++result.resimulated_tick_count;
        }
    }
    diagnostics_.resimulated_tick_count += result.resimulated_tick_count;

    CarState live = corrected;
    if (result.position_error >= settings_.hard_snap_threshold) {
        result.outcome = ReconcileOutcome::Snapped;
        ++diagnostics_.snapped_count;
        core::Logger::Info(
            "reconcile",
            "Snapped to authoritative tick " + std::to_string(authoritative.tick) +
                " (error " + std::to_string(result.position_error) + " m).");
    } else {
        live = BlendStates(pre_correction, corrected);
        result.outcome = ReconcileOutcome::Blended;
        ++diagnostics_.blended_count;
    }

    if (current_tick != kInvalidTick && current_tick >= authoritative.tick) {
        live.tick = current_tick;
        state_buffer.Store(current_tick, live);
    }
    prediction_.SetState(live);
    return result;
}

CarState Reconciler::BlendStates(const CarState& from, const CarState& to) const {
    const float t = core::Clamp01(settings_.correction_blend);
    CarState blended = to;
    blended.position = core::Lerp(from.position, to.position, t);
    blended.rotation = core::Slerp(from.rotation, to.rotation, t);
    blended.linear_velocity = core::Lerp(from.linear_velocity, to.linear_velocity, t);
    blended.angular_velocity = core::Lerp(from.angular_velocity, to.angular_velocity, t);
    return blended;
}

ReconcileDiagnostics Reconciler::DiagnosticsSnapshot() const {
    ReconcileDiagnostics snapshot = diagnostics_;
    snapshot.last_reconciled_tick = last_reconciled_tick_;
    return snapshot;
}

}  // namespace pitchsync::sim

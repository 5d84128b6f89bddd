#pragma once

#include "sim/entity_state.h"
#include "sim/prediction_engine.h"

#include <cstdint>

namespace pitchsync::sim {

enum class ReconcileOutcome : std::uint8_t {
    NothingPending = 0,
    Discarded = 1,
    WithinTolerance = 2,
    Blended = 3,
    Snapped = 4,
};

const char* ReconcileOutcomeName(ReconcileOutcome outcome);

struct ReconcileSettings final {
    float position_error_threshold = 0.5F;
    float rotation_error_threshold_deg = 5.0F;
    // Inclusive: an error equal to this value snaps.
    float hard_snap_threshold = 3.0F;
    // Fraction of the way from the pre-correction state to the corrected one.
    float correction_blend = 0.7F;
};

struct ReconcileResult final {
    ReconcileOutcome outcome = ReconcileOutcome::NothingPending;
    Tick snapshot_tick = kInvalidTick;
    float position_error = 0.0F;
    float rotation_error_deg = 0.0F;
    std::uint32_t resimulated_tick_count = 0;
    std::uint32_t skipped_stale_input_count = 0;
};

struct ReconcileDiagnostics final {
    Tick last_reconciled_tick = kInvalidTick;
    std::uint64_t received_snapshot_count = 0;
    std::uint64_t superseded_snapshot_count = 0;
    std::uint64_t stale_snapshot_drop_count = 0;
    std::uint64_t discarded_count = 0;
    std::uint64_t within_tolerance_count = 0;
    std::uint64_t blended_count = 0;
    std::uint64_t snapped_count = 0;
    std::uint64_t resimulated_tick_count = 0;
    float last_position_error = 0.0F;
    float max_position_error = 0.0F;
};

// Corrects the owner's predicted car against authoritative server state.
// Snapshots are queued when they arrive and applied between prediction steps.
class Reconciler final {
public:
    Reconciler(PredictionEngine& prediction, ReconcileSettings settings);

    void QueueAuthoritativeState(const CarState& authoritative);
    bool HasPending() const;
    ReconcileResult ApplyPending(double fixed_delta_seconds);

    ReconcileResult Reconcile(const CarState& authoritative, double fixed_delta_seconds);

    // Forgets queued and reconciled ticks after a forced respawn.
    void Reset();

    ReconcileDiagnostics DiagnosticsSnapshot() const;

private:
    CarState BlendStates(const CarState& from, const CarState& to) const;

    PredictionEngine& prediction_;
    ReconcileSettings settings_{};
    bool has_pending_ = false;
    CarState pending_{};
    Tick last_reconciled_tick_ = kInvalidTick;
    ReconcileDiagnostics diagnostics_{};
};

}  // namespace pitchsync::sim

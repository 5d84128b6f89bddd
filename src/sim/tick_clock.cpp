#include "sim/tick_clock.h"

#include <cmath>

namespace pitchsync::sim {
namespace {

// Absorbs accumulated rounding so that N additions of the fixed step land on tick N.
constexpr double kTickEpsilon = 1e-6;

}  // namespace

TickClock::TickClock(double fixed_delta_seconds)
    : fixed_delta_seconds_(fixed_delta_seconds > 0.0 ? fixed_delta_seconds : 1.0 / 60.0) {}

void TickClock::SetTimeSource(const ISyncedTimeSource* time_source) {
    time_source_ = time_source;
}

void TickClock::AdvanceLocal(double delta_seconds) {
    if (delta_seconds <= 0.0) {
        return;
    }
    local_elapsed_seconds_ += delta_seconds;
}

Tick TickClock::CurrentTick() {
    const Tick computed = TickForSeconds(ElapsedSeconds());
    if (last_reported_tick_ != kInvalidTick && computed < last_reported_tick_) {
        return last_reported_tick_;
    }

    last_reported_tick_ = computed;
    return computed;
}

Tick TickClock::LastReportedTick() const {
    return last_reported_tick_;
}

bool TickClock::IsSynchronized() const {
    return time_source_ != nullptr && time_source_->IsSynchronized();
}

double TickClock::ElapsedSeconds() const {
    if (IsSynchronized()) {
        return time_source_->EstimatedServerSeconds();
    }
    return local_elapsed_seconds_;
}

double TickClock::FixedDeltaSeconds() const {
    return fixed_delta_seconds_;
}

void TickClock::Reset() {
    local_elapsed_seconds_ = 0.0;
    last_reported_tick_ = kInvalidTick;
}

Tick TickClock::TickForSeconds(double elapsed_seconds) const {
    if (elapsed_seconds <= 0.0) {
        return 0;
    }

    const double ticks = std::floor(elapsed_seconds / fixed_delta_seconds_ + kTickEpsilon);
    if (ticks >= static_cast<double>(kInvalidTick)) {
        return kInvalidTick - 1;
    }
    return static_cast<Tick>(ticks);
}

}  // namespace pitchsync::sim

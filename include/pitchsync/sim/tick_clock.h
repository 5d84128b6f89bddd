#pragma once

#include "sim/tick.h"

namespace pitchsync::sim {

// Source of the server-relative simulation time on a client.
class ISyncedTimeSource {
public:
    virtual ~ISyncedTimeSource() = default;

    virtual bool IsSynchronized() const = 0;
    virtual double EstimatedServerSeconds() const = 0;
};

class TickClock final {
public:
    explicit TickClock(double fixed_delta_seconds);

    // Non-owning. The source must outlive the clock or be detached with nullptr.
    void SetTimeSource(const ISyncedTimeSource* time_source);

    // Advances the local simulation time. The server's elapsed time is ground
    // truth; on a client it is only used until the time source synchronizes.
    void AdvanceLocal(double delta_seconds);

    Tick CurrentTick();
    Tick LastReportedTick() const;
    bool IsSynchronized() const;
    double ElapsedSeconds() const;
    double FixedDeltaSeconds() const;

    void Reset();

private:
    Tick TickForSeconds(double elapsed_seconds) const;

    double fixed_delta_seconds_ = 1.0 / 60.0;
    double local_elapsed_seconds_ = 0.0;
    const ISyncedTimeSource* time_source_ = nullptr;
    Tick last_reported_tick_ = kInvalidTick;
};

}  // namespace pitchsync::sim

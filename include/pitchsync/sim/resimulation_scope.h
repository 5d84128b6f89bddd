#pragma once

namespace pitchsync::sim {

// True while a reconciler replays buffered ticks. One-shot side effects
// (sounds, particles, script events) must be skipped while it is set.
bool IsResimulating();

// Raises the resimulation flag for its lifetime and restores the previous
// value on exit, including early returns and exceptions.
class ResimulationScope final {
public:
    ResimulationScope();
    ~ResimulationScope();

    ResimulationScope(const ResimulationScope&) = delete;
    ResimulationScope& operator=(const ResimulationScope&) = delete;

private:
    bool previous_value_ = false;
};

}  // namespace pitchsync::sim

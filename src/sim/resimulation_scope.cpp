#include "sim/resimulation_scope.h"

#include <atomic>

namespace pitchsync::sim {
namespace {

std::atomic_bool& ResimulationFlag() {
    static std::atomic_bool flag{false};
    return flag;
}

}  // namespace

bool IsResimulating() {
    return ResimulationFlag().load();
}

ResimulationScope::ResimulationScope()
    : previous_value_(ResimulationFlag().exchange(true)) {}

ResimulationScope::~ResimulationScope() {
    ResimulationFlag().store(previous_value_);
}

}  // namespace pitchsync::sim

#include "sim/arena.h"

namespace pitchsync::sim {

const ArenaSettings& DefaultArenaSettings() {
    static const ArenaSettings settings{};
    return settings;
}

}  // namespace pitchsync::sim

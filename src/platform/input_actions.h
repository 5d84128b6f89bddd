#pragma once

#include "sim/input_sample.h"

namespace pitchsync::platform {

struct InputActions final {
    sim::InputFrame frame{};

    bool toggle_debug_overlay = false;
    bool debug_net_disconnect = false;
    bool debug_net_connect = false;
};

}  // namespace pitchsync::platform

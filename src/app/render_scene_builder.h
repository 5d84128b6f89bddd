#pragma once

#include "app/client_session.h"
#include "platform/render_scene.h"
#include "sim/arena.h"

namespace pitchsync::app {

struct RenderOverlayState final {
    bool connected = false;
    bool show_debug_overlay = false;
    float rtt_seconds = 0.0F;
    float match_duration_seconds = 180.0F;
};

class RenderSceneBuilder final {
public:
    platform::RenderScene Build(
        const ClientSession& session,
        const sim::ArenaSettings& arena,
        const RenderOverlayState& overlay) const;
};

}  // namespace pitchsync::app

#pragma once

#include "app/client_session.h"
#include "core/config.h"
#include "sim/match_world.h"

namespace pitchsync::app {

// Translates the loaded config into the settings each engine takes.
sim::MatchSettings MakeMatchSettings(const core::SyncConfig& config);
ClientSessionSettings MakeClientSessionSettings(const core::SyncConfig& config);

}  // namespace pitchsync::app

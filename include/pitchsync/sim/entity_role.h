#pragma once

#include "sim/authoritative_sim_engine.h"
#include "sim/entity_state.h"
#include "sim/prediction_engine.h"
#include "sim/reconciler.h"
#include "sim/remote_replicator.h"

#include <cstdint>
#include <memory>
#include <variant>

namespace pitchsync::sim {

// A car entity is built in exactly one role and keeps it for its lifetime.

struct LocallyPredicted final {
    std::unique_ptr<PredictionEngine> prediction;
    std::unique_ptr<Reconciler> reconciler;
};

struct ServerAuthoritative final {
    std::unique_ptr<AuthoritativeSimEngine> engine;
};

struct RemoteReplicated final {
    std::unique_ptr<RemoteCarReplicator> replicator;
};

using CarRole = std::variant<LocallyPredicted, ServerAuthoritative, RemoteReplicated>;

struct PlayerSlot final {
    std::uint8_t value = 0;
};

struct BallContact final {
    bool touching = false;
};

RenderTransform CurrentRenderTransform(const CarRole& role);

}  // namespace pitchsync::sim

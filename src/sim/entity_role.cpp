#include "sim/entity_role.h"

#include <type_traits>

namespace pitchsync::sim {
namespace {

RenderTransform TransformOf(const CarState& state) {
    return RenderTransform{
        .position = state.position,
        .rotation = state.rotation,
    };
}

}  // namespace

RenderTransform CurrentRenderTransform(const CarRole& role) {
    return std::visit(
        [](const auto& value) -> RenderTransform {
            using Role = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<Role, LocallyPredicted>) {
                return value.prediction != nullptr ? TransformOf(value.prediction->State())
                                                   : RenderTransform{};
            } else if constexpr (std::is_same_v<Role, ServerAuthoritative>) {
                return value.engine != nullptr ? TransformOf(value.engine->State()) : RenderTransform{};
            } else {
                return value.replicator != nullptr ? value.replicator->Transform() : RenderTransform{};
            }
        },
        role);
}

}  // namespace pitchsync::sim

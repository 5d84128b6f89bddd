#pragma once

#include "app/client_session.h"
#include "app/render_scene_builder.h"
#include "core/config.h"
#include "net/client_net_service.h"
#include "platform/input_actions.h"
#include "platform/sdl_context.h"
#include "script/lua_jit_script_host.h"
#include "sim/car_physics.h"

#include <cstdint>
#include <filesystem>
#include <memory>

namespace pitchsync::app {

class GameApp final {
public:
    GameApp();

    bool Initialize(const std::filesystem::path& config_path);
    int Run();
    void Shutdown();

private:
    void UpdateFixedStep(double fixed_delta_seconds);
    void SyncSessionWithNet();
    void DrainNetSnapshots();
    void LogDiagnostics();

    bool initialized_ = false;
    bool quit_requested_ = false;
    bool show_debug_overlay_ = false;
    core::SyncConfig config_;
    platform::SdlContext sdl_context_;
    platform::InputActions frame_actions_;
    sim::ArenaCarPhysics car_physics_;
    script::LuaJitScriptHost script_host_;
    std::unique_ptr<net::ClientNetService> net_service_;
    std::unique_ptr<ClientSession> session_;
    RenderSceneBuilder render_scene_builder_;
    std::uint64_t local_tick_index_ = 0;
};

}  // namespace pitchsync::app

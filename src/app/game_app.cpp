#include "app/game_app.h"

#include "app/game_loop.h"
#include "app/sync_settings.h"
#include "core/logger.h"

#include <string>
#include <utility>

namespace pitchsync::app {
namespace {

constexpr std::uint64_t kDiagnosticsPeriodTicks = 300;

}  // namespace

GameApp::GameApp() = default;

bool GameApp::Initialize(const std::filesystem::path& config_path) {
    std::string config_error;
    if (std::filesystem::exists(config_path)) {
        if (!core::ConfigLoader::Load(config_path, config_, config_error)) {
            core::Logger::Error("config", "Config load failed: " + config_error);
            return false;
        }
        core::Logger::Info("config", "Config loaded: " + config_path.string());
    } else {
        core::Logger::Info(
            "config",
            "Config not found, using defaults: " + config_path.string());
    }

    core::LogLevel log_level = core::LogLevel::Info;
    if (core::TryParseLogLevel(config_.log_level, log_level)) {
        core::Logger::SetMinimumLevel(log_level);
    }

    if (!sdl_context_.Initialize(config_)) {
        core::Logger::Error("app", "SDL3 initialization failed.");
        return false;
    }

    std::string script_error;
    script::ScriptSource rules_source{};
    if (!script::LoadScriptSourceFile(config_.script_path, rules_source, script_error)) {
        core::Logger::Warn("script", "Rules script not loaded: " + script_error);
    } else if (!script_host_.SetRulesScript(std::move(rules_source), script_error)) {
        core::Logger::Warn("script", "Rules script rejected: " + script_error);
    }
    if (!script_host_.Initialize(script_error)) {
        core::Logger::Warn("script", "Script host disabled: " + script_error);
    }

    net_service_ = std::make_unique<net::ClientNetService>(net::ClientNetSettings{
        .bind_host = config_.net_udp_local_host,
        .bind_port = static_cast<std::uint16_t>(config_.net_udp_local_port),
        .server = net::UdpEndpoint{
            .host = config_.net_udp_server_host,
            .port = static_cast<std::uint16_t>(config_.net_udp_server_port),
        },
    });
    std::string net_error;
    if (!net_service_->Initialize(net_error)) {
        core::Logger::Error("net", "Client net service initialization failed: " + net_error);
        script_host_.Shutdown();
        sdl_context_.Shutdown();
        net_service_.reset();
        return false;
    }
    net_service_->Clock().SetLeadSeconds(config_.input_lead_ticks * config_.FixedDeltaSeconds());

    session_ = std::make_unique<ClientSession>(
        car_physics_,
        *net_service_,
        script_host_,
        MakeClientSessionSettings(config_));
    session_->SetTimeSource(&net_service_->Clock());

    net_service_->RequestConnect();
    local_tick_index_ = 0;
    initialized_ = true;
    core::Logger::Info(
        "input",
        "Controls: W/S throttle, A/D steer, Space jump, Shift boost, Ctrl air roll/drift, Q/E roll, Up/Down pitch, F1 debug overlay, F5/F6 connect/disconnect.");
    core::Logger::Info(
        "app",
        "pitchsync client started, server " + config_.net_udp_server_host + ":" +
            std::to_string(config_.net_udp_server_port) + ".");
    return true;
}

int GameApp::Run() {
    if (!initialized_) {
        core::Logger::Error("app", "Run called before initialization.");
        return 1;
    }

    GameLoop loop(config_.FixedDeltaSeconds());
    loop.Run(
        [this]() -> bool {
            frame_actions_ = {};
            if (!sdl_context_.PumpEvents(quit_requested_, frame_actions_)) {
                core::Logger::Error("platform", "Event pump failed.");
                return false;
            }

            if (frame_actions_.toggle_debug_overlay) {
                show_debug_overlay_ = !show_debug_overlay_;
            }
            if (frame_actions_.debug_net_connect) {
                net_service_->RequestConnect();
            }
            if (frame_actions_.debug_net_disconnect) {
                net_service_->RequestDisconnect();
            }

            session_->AccumulateInput(frame_actions_.frame);
            return !quit_requested_;
        },
        [this](double fixed_delta_seconds) {
            UpdateFixedStep(fixed_delta_seconds);
        },
        [this](float, double frame_seconds) {
            session_->AdvanceRender(frame_seconds);
            const platform::RenderScene scene = render_scene_builder_.Build(
                *session_,
                car_physics_.Arena(),
                RenderOverlayState{
                    .connected = net_service_->SessionState() == net::NetSessionState::Connected,
                    .show_debug_overlay = show_debug_overlay_,
                    .rtt_seconds = static_cast<float>(net_service_->Clock().SmoothedRttSeconds()),
                    .match_duration_seconds = static_cast<float>(config_.match_duration_seconds),
                });
            sdl_context_.RenderFrame(scene);
        });

    core::Logger::Info("app", "Main loop exited.");
    return 0;
}

void GameApp::Shutdown() {
    if (!initialized_) {
        return;
    }

    LogDiagnostics();
    session_.reset();
    net_service_->Shutdown();
    net_service_.reset();
    script_host_.Shutdown();
    sdl_context_.Shutdown();
    initialized_ = false;
    core::Logger::Info("app", "pitchsync client shutdown complete.");
}

void GameApp::UpdateFixedStep(double fixed_delta_seconds) {
    const core::TickContext tick_context{
        .tick_index = local_tick_index_,
        .fixed_delta_seconds = fixed_delta_seconds,
    };
    net_service_->Tick(tick_context);
    SyncSessionWithNet();
    DrainNetSnapshots();

    const ClientStepResult step = session_->Step(fixed_delta_seconds);
    if (step.reconcile.outcome == sim::ReconcileOutcome::Snapped) {
        core::Logger::Debug(
            "reconcile",
            "Snapped at tick " + std::to_string(step.reconcile.snapshot_tick) +
                ", error=" + std::to_string(step.reconcile.position_error) + "m.");
    }
    script_host_.Tick(tick_context);

    ++local_tick_index_;
    if (local_tick_index_ % kDiagnosticsPeriodTicks == 0) {
        LogDiagnostics();
    }
}

void GameApp::SyncSessionWithNet() {
    const bool connected = net_service_->SessionState() == net::NetSessionState::Connected;
    if (connected && net_service_->HasPlayerSlot() &&
        (!session_->HasLocalPlayerSlot() ||
         session_->LocalPlayerSlot() != net_service_->PlayerSlot())) {
        session_->SetLocalPlayerSlot(net_service_->PlayerSlot());
        return;
    }

    if (!connected && session_->HasLocalPlayerSlot()) {
        session_->Clear();
        core::Logger::Info("app", "Session cleared after disconnect.");
    }
}

void GameApp::DrainNetSnapshots() {
    for (const sim::MatchStatus& status : net_service_->ConsumeMatchStatuses()) {
        session_->ReceiveMatchStatus(status);
    }
    for (const sim::CarState& state : net_service_->ConsumeOwnerStates()) {
        session_->ReceiveOwnerState(state);
    }
    for (const wire::RemoteCarPayload& remote : net_service_->ConsumeRemoteCars()) {
        session_->ReceiveRemoteCar(remote.player_slot, remote.snapshot);
    }
    for (const sim::BallState& ball : net_service_->ConsumeBallStates()) {
        session_->ReceiveBallState(ball);
    }
}

void GameApp::LogDiagnostics() {
    const net::NetDiagnosticsSnapshot net = net_service_->DiagnosticsSnapshot();
    const ClientSessionDiagnostics session = session_ != nullptr
        ? session_->DiagnosticsSnapshot()
        : ClientSessionDiagnostics{};
    const net::TimeSync& clock = net_service_->Clock();
    core::Logger::Info(
        "net",
        "Diagnostics: state=" + std::string(net::NetSessionStateName(net.session_state)) +
            ", last_transition_reason=" + net.last_session_transition_reason +
            ", datagrams(sent/received/send_fail)=" +
            std::to_string(net.sent_datagram_count) + "/" +
            std::to_string(net.received_datagram_count) + "/" +
            std::to_string(net.send_failure_count) +
            ", decode_failures=" + std::to_string(net.decode_failure_count) +
            ", rtt_ms=" + std::to_string(clock.SmoothedRttSeconds() * 1000.0) +
            ", time_samples(accepted/rejected)=" +
            std::to_string(clock.AcceptedSampleCount()) + "/" +
            std::to_string(clock.RejectedSampleCount()));
    if (!session.has_local_car) {
        return;
    }

    core::Logger::Info(
        "reconcile",
        "Diagnostics: predicted_tick=" + std::to_string(session.last_predicted_tick) +
            ", snapshots(received/discarded/stale)=" +
            std::to_string(session.reconcile.received_snapshot_count) + "/" +
            std::to_string(session.reconcile.discarded_count) + "/" +
            std::to_string(session.reconcile.stale_snapshot_drop_count) +
            ", outcomes(ok/blend/snap)=" +
            std::to_string(session.reconcile.within_tolerance_count) + "/" +
            std::to_string(session.reconcile.blended_count) + "/" +
            std::to_string(session.reconcile.snapped_count) +
            ", resimulated_ticks=" + std::to_string(session.reconcile.resimulated_tick_count) +
            ", max_error=" + std::to_string(session.reconcile.max_position_error) +
            ", re_anchors=" + std::to_string(session.re_anchor_count));
}

}  // namespace pitchsync::app

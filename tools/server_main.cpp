#include "app/sync_settings.h"
#include "core/config.h"
#include "core/logger.h"
#include "net/server_net_service.h"
#include "script/lua_jit_script_host.h"
#include "sim/ball_physics.h"
#include "sim/car_physics.h"
#include "sim/match_world.h"
#include "sim/tick_clock.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace {

struct ServerOptions final {
    std::filesystem::path config_path = "config/pitchsync_server.cfg";
    std::uint64_t ticks = 0;
    double fixed_delta_seconds = 0.0;
    std::uint64_t log_interval_ticks = 300;
};

std::atomic_bool g_keep_running{true};

void OnSignal(int signal_code) {
    (void)signal_code;
    g_keep_running.store(false);
}

bool ParseUInt64(std::string_view text, std::uint64_t& out_value) {
    try {
        std::size_t consumed = 0;
        out_value = static_cast<std::uint64_t>(std::stoull(std::string(text), &consumed));
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseDouble(std::string_view text, double& out_value) {
    try {
        std::size_t consumed = 0;
        out_value = std::stod(std::string(text), &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseArguments(
    int argc,
    char** argv,
    ServerOptions& out_options,
    std::string& out_error) {
    for (int index = 1; index < argc; ++index) {
        const std::string arg = argv[index];
        auto read_value = [&](const char* key) -> std::string {
            if (index + 1 >= argc) {
                out_error = std::string("Missing value for option: ") + key;
                return {};
            }
            ++index;
            return argv[index];
        };

        if (arg == "--config") {
            const std::string value = read_value("--config");
            if (value.empty()) {
                return false;
            }
            out_options.config_path = value;
            continue;
        }

        if (arg == "--ticks") {
            const std::string value = read_value("--ticks");
            if (value.empty()) {
                return false;
            }
            if (!ParseUInt64(value, out_options.ticks)) {
                out_error = "Invalid --ticks value";
                return false;
            }
            continue;
        }

        if (arg == "--fixed-delta") {
            const std::string value = read_value("--fixed-delta");
            if (value.empty()) {
                return false;
            }
            if (!ParseDouble(value, out_options.fixed_delta_seconds) ||
                out_options.fixed_delta_seconds <= 0.0) {
                out_error = "--fixed-delta must be a number > 0";
                return false;
            }
            continue;
        }

        if (arg == "--log-interval") {
            const std::string value = read_value("--log-interval");
            if (value.empty()) {
                return false;
            }
            if (!ParseUInt64(value, out_options.log_interval_ticks)) {
                out_error = "Invalid --log-interval value";
                return false;
            }
            continue;
        }

        out_error = "Unknown option: " + arg;
        return false;
    }

    out_error.clear();
    return true;
}

void PrintUsage() {
    std::cout
        << "Usage:\n"
        << "  pitchsync_server [--config <path>] [--ticks <count>] "
        << "[--fixed-delta <seconds>] [--log-interval <ticks>]\n"
        << "\n"
        << "Examples:\n"
        << "  pitchsync_server --config config/pitchsync_server.cfg --ticks 10800\n"
        << "  pitchsync_server --fixed-delta 0.0166667 --log-interval 600\n";
}

std::string MatchEventPayload(const pitchsync::sim::MatchEvent& event) {
    return "tick=" + std::to_string(event.tick) +
        " slot=" + std::to_string(event.player_slot) +
        " score=" + std::to_string(event.score_player_one) + "-" +
        std::to_string(event.score_player_two);
}

}  // namespace

int main(int argc, char** argv) {
    using namespace pitchsync;

    ServerOptions options{};
    std::string error;
    if (!ParseArguments(argc, argv, options, error)) {
        std::cerr << "[ERROR] " << error << '\n';
        PrintUsage();
        return 1;
    }

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    core::SyncConfig config{};
    if (std::filesystem::exists(options.config_path)) {
        if (!core::ConfigLoader::Load(options.config_path, config, error)) {
            std::cerr << "[ERROR] config load failed: " << error << '\n';
            return 1;
        }
        core::Logger::Info("server", "Config loaded: " + options.config_path.string());
    } else {
        core::Logger::Info(
            "server",
            "Config not found, using defaults: " + options.config_path.string());
    }

    core::LogLevel log_level = core::LogLevel::Info;
    if (core::TryParseLogLevel(config.log_level, log_level)) {
        core::Logger::SetMinimumLevel(log_level);
    }

    const double fixed_delta_seconds = options.fixed_delta_seconds > 0.0
        ? options.fixed_delta_seconds
        : config.FixedDeltaSeconds();

    script::LuaJitScriptHost script_host;
    script::ScriptSource rules_source{};
    if (!script::LoadScriptSourceFile(config.script_path, rules_source, error)) {
        core::Logger::Warn("script", "Rules script not loaded: " + error);
    } else if (!script_host.SetRulesScript(std::move(rules_source), error)) {
        core::Logger::Warn("script", "Rules script rejected: " + error);
    }
    if (!script_host.Initialize(error)) {
        core::Logger::Warn("script", "Script host disabled: " + error);
    } else {
        const script::ScriptRuntimeDescriptor descriptor = script_host.RuntimeDescriptor();
        core::Logger::Info(
            "script",
            "Script runtime active: backend=" + descriptor.backend_name +
                ", api_version=" + descriptor.api_version +
                ", sandbox=" + descriptor.sandbox_level +
                ", event_handler=" + (descriptor.has_event_handler ? "true" : "false"));
    }

    net::ServerNetService net_service(net::ServerNetSettings{
        .bind_host = config.net_udp_local_host,
        .bind_port = static_cast<std::uint16_t>(config.net_udp_local_port),
        .tick_rate_hz = static_cast<std::uint16_t>(config.tick_rate_hz),
    });
    if (!net_service.Initialize(error)) {
        std::cerr << "[ERROR] server net initialize failed: " << error << '\n';
        script_host.Shutdown();
        return 1;
    }

    const sim::ArenaCarPhysics car_physics;
    const sim::BallPhysics ball_physics;
    sim::MatchWorld match_world(
        car_physics,
        ball_physics,
        net_service,
        app::MakeMatchSettings(config));

    core::Logger::Info(
        "server",
        "Server started: local=" + config.net_udp_local_host +
            ":" + std::to_string(net_service.LocalPort()) +
            ", tick_rate=" + std::to_string(config.tick_rate_hz) +
            ", ticks_limit=" + std::to_string(options.ticks));

    const auto tick_duration = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(fixed_delta_seconds));
    auto next_tick_time = std::chrono::steady_clock::now();
    sim::TickClock clock(fixed_delta_seconds);
    while (g_keep_running.load()) {
        const sim::Tick sim_tick = clock.CurrentTick();
        if (options.ticks > 0 && sim_tick >= options.ticks) {
            break;
        }

        const core::TickContext tick_context{
            .tick_index = sim_tick,
            .fixed_delta_seconds = fixed_delta_seconds,
        };
        net_service.Tick(tick_context, clock.ElapsedSeconds());

        for (const net::PeerEvent& peer_event : net_service.ConsumePeerEvents()) {
            if (peer_event.type == net::PeerEventType::Joined) {
                if (!match_world.AddPlayer(peer_event.player_slot, sim_tick)) {
                    core::Logger::Warn(
                        "server",
                        "Slot " + std::to_string(peer_event.player_slot) + " already occupied.");
                }
            } else {
                match_world.RemovePlayer(peer_event.player_slot, sim_tick);
            }
        }

        for (const net::InboundInput& inbound : net_service.ConsumeInputs()) {
            if (!match_world.ReceiveInput(inbound.player_slot, inbound.input)) {
                core::Logger::Debug(
                    "server",
                    "Rejected input for tick " + std::to_string(inbound.input.tick) +
                        " from slot " + std::to_string(inbound.player_slot) + ".");
            }
        }

        match_world.Step(sim_tick, fixed_delta_seconds);

        for (const sim::MatchEvent& event : match_world.ConsumeEvents()) {
            script_host.DispatchEvent(script::ScriptEvent{
                .event_name = sim::MatchEventTypeName(event.type),
                .payload = MatchEventPayload(event),
            });
        }
        script_host.Tick(tick_context);

        if (options.log_interval_ticks > 0 &&
            sim_tick > 0 &&
            sim_tick % options.log_interval_ticks == 0) {
            const net::NetDiagnosticsSnapshot net_diagnostics = net_service.DiagnosticsSnapshot();
            const sim::MatchDiagnostics match_diagnostics = match_world.DiagnosticsSnapshot();
            const sim::MatchStatus status = match_world.Status();
            core::Logger::Info(
                "server",
                "Tick=" + std::to_string(sim_tick) +
                    ", phase=" + sim::MatchPhaseName(status.phase) +
                    ", score=" + std::to_string(status.score_player_one) + "-" +
                    std::to_string(status.score_player_two) +
                    ", players=" + std::to_string(match_diagnostics.player_count) +
                    ", touches=" + std::to_string(match_diagnostics.ball_touch_count) +
                    ", datagrams(sent/received)=" +
                    std::to_string(net_diagnostics.sent_datagram_count) + "/" +
                    std::to_string(net_diagnostics.received_datagram_count) +
                    ", decode_failures=" + std::to_string(net_diagnostics.decode_failure_count) +
                    ", timeout_disconnects=" + std::to_string(net_diagnostics.timeout_disconnect_count) +
                    ", script_failures=" + std::to_string(script_host.FailedCallCount()));
            for (std::uint8_t slot = 0; slot < sim::kMaxPlayers; ++slot) {
                const sim::AuthoritativeSimEngine* engine = match_world.Engine(slot);
                if (engine == nullptr) {
                    continue;
                }
                const sim::SimDiagnostics sim_diagnostics = engine->DiagnosticsSnapshot();
                core::Logger::Info(
                    "sim",
                    "Player " + std::to_string(slot + 1) +
                        ": inputs(received/rejected)=" +
                        std::to_string(sim_diagnostics.received_input_count) + "/" +
                        std::to_string(sim_diagnostics.rejected_input_count) +
                        ", applied(fresh/repeat/neutral)=" +
                        std::to_string(sim_diagnostics.fresh_input_count) + "/" +
                        std::to_string(sim_diagnostics.stale_repeat_input_count) + "/" +
                        std::to_string(sim_diagnostics.neutral_input_count));
            }
        }

        clock.AdvanceLocal(fixed_delta_seconds);
        next_tick_time += tick_duration;
        std::this_thread::sleep_until(next_tick_time);
    }

    net_service.Shutdown();
    script_host.Shutdown();
    core::Logger::Info("server", "Server stopped.");
    return 0;
}

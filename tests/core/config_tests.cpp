#include "core/config.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

std::filesystem::path BuildTestDirectory() {
    const auto unique_seed =
        std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
        ("pitchsync_config_loader_test_" + std::to_string(unique_seed));
}

bool WriteConfigFile(const std::filesystem::path& file_path, const std::string& content) {
    std::ofstream file(file_path, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    file.close();
    return true;
}

}  // namespace

int main() {
    using pitchsync::core::ConfigLoader;
    using pitchsync::core::SyncConfig;

    bool passed = true;

    const std::filesystem::path test_dir = BuildTestDirectory();
    const std::filesystem::path config_path = test_dir / "pitchsync.cfg";
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
    std::filesystem::create_directories(test_dir, ec);

    passed &= Expect(
        WriteConfigFile(
            config_path,
            "# window only\n"
            "[window]\n"
            "window_title = \"CfgTest\"  # trailing comment\n"
            "window_width = 1600\n"
            "window_height = 900\n"
            "vsync = false\n"),
        "Config file write should succeed.");

    SyncConfig default_config{};
    std::string error;
    passed &= Expect(ConfigLoader::Load(config_path, default_config, error), "Config load should succeed.");
    passed &= Expect(error.empty(), "Successful config load should not return error.");
    passed &= Expect(default_config.window_title == "CfgTest", "Quoted title should parse.");
    passed &= Expect(!default_config.vsync, "Boolean should parse.");
    passed &= Expect(default_config.tick_rate_hz == 60, "Tick rate should default to 60 Hz.");
    passed &= Expect(default_config.ring_buffer_capacity == 1024, "Ring buffer should default to 1024 ticks.");
    passed &= Expect(default_config.hard_snap_threshold == 3.0, "Snap threshold should default to 3 m.");
    passed &= Expect(default_config.correction_blend == 0.7, "Blend should default to 0.7.");
    passed &= Expect(default_config.remote_state_interval_ticks == 6, "Remote cadence should default to 6 ticks.");
    passed &= Expect(default_config.net_udp_server_port == 40400, "Server port should default to 40400.");

    passed &= Expect(
        WriteConfigFile(
            config_path,
            "tick_rate_hz = 120\n"
            "ring_buffer_capacity = 2048\n"
            "max_round_trip_ticks = 240\n"
            "owner_state_interval_ticks = 1\n"
            "remote_state_interval_ticks = 2\n"
            "input_lead_ticks = 0\n"
            "position_error_threshold = 0.25\n"
            "hard_snap_threshold = 2.5\n"
            "correction_blend = 1\n"
            "match_duration_seconds = 300\n"
            "log_level = \"debug\"\n"
            "net_udp_local_host = \"0.0.0.0\"\n"
            "net_udp_local_port = 24000\n"
            "net_udp_server_port = 24001\n"
            "script_path = \"rules/custom.lua\"\n"
            "unknown_key = 5\n"),
        "Full config file write should succeed.");

    SyncConfig tuned{};
    passed &= Expect(ConfigLoader::Load(config_path, tuned, error), "Full config should load, ignoring unknown keys.");
    passed &= Expect(tuned.tick_rate_hz == 120, "Tick rate should parse.");
    passed &= Expect(tuned.FixedDeltaSeconds() == 1.0 / 120.0, "Fixed delta should follow the tick rate.");
    passed &= Expect(tuned.owner_state_interval_ticks == 1, "Owner cadence should parse.");
    passed &= Expect(tuned.input_lead_ticks == 0, "Zero input lead should be allowed.");
    passed &= Expect(tuned.position_error_threshold == 0.25, "Position threshold should parse.");
    passed &= Expect(tuned.correction_blend == 1.0, "Blend should parse.");
    passed &= Expect(tuned.log_level == "debug", "Log level should parse.");
    passed &= Expect(
        tuned.net_udp_local_port == 24000 && tuned.net_udp_server_port == 24001,
        "Net UDP ports should parse correctly.");
    passed &= Expect(tuned.net_udp_local_host == "0.0.0.0", "Net UDP local host should parse correctly.");
    passed &= Expect(tuned.script_path == "rules/custom.lua", "Script path should parse.");

    const struct {
        const char* content;
        const char* message;
    } invalid_cases[] = {
        {"tick_rate_hz = 0\n", "Zero tick rate should be rejected."},
        {"tick_rate_hz = fast\n", "Non-numeric tick rate should be rejected."},
        {"ring_buffer_capacity = 200\n", "Buffer shorter than two round trips should be rejected."},
        {"correction_blend = 1.5\n", "Blend above 1 should be rejected."},
        {"hard_snap_threshold = -1\n", "Negative threshold should be rejected."},
        {"position_error_threshold = 4\n", "Snap threshold below the tolerance should be rejected."},
        {"net_udp_server_port = 70000\n", "Out-of-range port should be rejected."},
        {"log_level = \"verbose\"\n", "Unknown log level should be rejected."},
        {"window_title = CfgTest\n", "Unquoted string should be rejected."},
        {"vsync = yes\n", "Non-boolean vsync should be rejected."},
        {"input_lead_ticks = -2\n", "Negative input lead should be rejected."},
        {"tick_rate_hz 60\n", "Line without '=' should be rejected."},
    };
    for (const auto& invalid_case : invalid_cases) {
        passed &= Expect(WriteConfigFile(config_path, invalid_case.content), "Invalid config write should succeed.");
        SyncConfig rejected{};
        const bool loaded = ConfigLoader::Load(config_path, rejected, error);
        passed &= Expect(!loaded, invalid_case.message);
        passed &= Expect(!error.empty(), "Rejected config should return readable error.");
    }

    SyncConfig missing_file_config{};
    passed &= Expect(
        !ConfigLoader::Load(test_dir / "missing.cfg", missing_file_config, error),
        "Missing config file should fail to load.");

    SyncConfig shipped_client{};
    passed &= Expect(
        ConfigLoader::Load(
            std::filesystem::path(PITCHSYNC_SOURCE_DIR) / "config" / "pitchsync.cfg",
            shipped_client,
            error),
        "Shipped client config should load.");
    SyncConfig shipped_server{};
    passed &= Expect(
        ConfigLoader::Load(
            std::filesystem::path(PITCHSYNC_SOURCE_DIR) / "config" / "pitchsync_server.cfg",
            shipped_server,
            error),
        "Shipped server config should load.");

    std::filesystem::remove_all(test_dir, ec);

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] pitchsync_config_tests\n";
    return 0;
}

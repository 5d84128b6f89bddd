#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace pitchsync::core {

struct SyncConfig final {
    int tick_rate_hz = 60;
    int ring_buffer_capacity = 1024;
    int max_round_trip_ticks = 120;

    int owner_state_interval_ticks = 2;
    int remote_state_interval_ticks = 6;
    int ball_state_interval_ticks = 6;
    int input_send_interval_ticks = 2;
    int input_lead_ticks = 2;
    int max_catch_up_ticks = 8;

    double position_error_threshold = 0.5;
    double rotation_error_threshold_deg = 5.0;
    double hard_snap_threshold = 3.0;
    double correction_blend = 0.7;

    double remote_min_interp_seconds = 0.033;
    double ball_min_interp_seconds = 0.016;
    double ball_max_extrapolation_seconds = 0.25;

    double match_duration_seconds = 180.0;

    std::string log_level = "info";

    std::string window_title = "pitchsync";
    int window_width = 1280;
    int window_height = 720;
    bool vsync = true;

    std::string net_udp_local_host = "127.0.0.1";
    int net_udp_local_port = 0;
    std::string net_udp_server_host = "127.0.0.1";
    int net_udp_server_port = 40400;

    std::string script_path = "scripts/match_rules.lua";

    double FixedDeltaSeconds() const;
};

class ConfigLoader final {
public:
    static bool Load(
        const std::filesystem::path& file_path,
        SyncConfig& out_config,
        std::string& out_error);

    static bool Validate(const SyncConfig& config, std::string& out_error);
};

}  // namespace pitchsync::core

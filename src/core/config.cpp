#include "core/config.h"

#include "core/cfg_parser.h"
#include "core/logger.h"

#include <string>
#include <vector>

namespace pitchsync::core {
namespace {

std::string LineSuffix(int line_number) {
    return ": line " + std::to_string(line_number);
}

bool ParsePort(std::string_view value, int& out_port) {
    int parsed_port = 0;
    if (!cfg::ParseInt(value, parsed_port)) {
        return false;
    }

    if (parsed_port < 0 || parsed_port > 65535) {
        return false;
    }

    out_port = parsed_port;
    return true;
}

bool ParsePositiveInt(std::string_view value, int& out_value) {
    int parsed = 0;
    if (!cfg::ParseInt(value, parsed) || parsed <= 0) {
        return false;
    }
    out_value = parsed;
    return true;
}

bool ParseNonNegativeDouble(std::string_view value, double& out_value) {
    double parsed = 0.0;
    if (!cfg::ParseDouble(value, parsed) || parsed < 0.0) {
        return false;
    }
    out_value = parsed;
    return true;
}

struct IntKey final {
    const char* key;
    int SyncConfig::*field;
};

struct DoubleKey final {
    const char* key;
    double SyncConfig::*field;
};

constexpr IntKey kPositiveIntKeys[] = {
    {"tick_rate_hz", &SyncConfig::tick_rate_hz},
    {"ring_buffer_capacity", &SyncConfig::ring_buffer_capacity},
    {"max_round_trip_ticks", &SyncConfig::max_round_trip_ticks},
    {"owner_state_interval_ticks", &SyncConfig::owner_state_interval_ticks},
    {"remote_state_interval_ticks", &SyncConfig::remote_state_interval_ticks},
    {"ball_state_interval_ticks", &SyncConfig::ball_state_interval_ticks},
    {"input_send_interval_ticks", &SyncConfig::input_send_interval_ticks},
    {"max_catch_up_ticks", &SyncConfig::max_catch_up_ticks},
    {"window_width", &SyncConfig::window_width},
    {"window_height", &SyncConfig::window_height},
};

constexpr DoubleKey kDoubleKeys[] = {
    {"position_error_threshold", &SyncConfig::position_error_threshold},
    {"rotation_error_threshold_deg", &SyncConfig::rotation_error_threshold_deg},
    {"hard_snap_threshold", &SyncConfig::hard_snap_threshold},
    {"correction_blend", &SyncConfig::correction_blend},
    {"remote_min_interp_seconds", &SyncConfig::remote_min_interp_seconds},
    {"ball_min_interp_seconds", &SyncConfig::ball_min_interp_seconds},
    {"ball_max_extrapolation_seconds", &SyncConfig::ball_max_extrapolation_seconds},
    {"match_duration_seconds", &SyncConfig::match_duration_seconds},
};

}  // namespace

double SyncConfig::FixedDeltaSeconds() const {
    return tick_rate_hz > 0 ? 1.0 / static_cast<double>(tick_rate_hz) : 0.0;
}

bool ConfigLoader::Load(
    const std::filesystem::path& file_path,
    SyncConfig& out_config,
    std::string& out_error) {
    std::vector<cfg::KeyValueLine> lines;
    if (!cfg::ParseFile(file_path, lines, out_error)) {
        return false;
    }

    for (const cfg::KeyValueLine& line : lines) {
        const std::string& key = line.key;
        const std::string& value = line.value;

        bool handled = false;
        for (const IntKey& entry : kPositiveIntKeys) {
            if (key != entry.key) {
                continue;
            }
            if (!ParsePositiveInt(value, out_config.*entry.field)) {
                out_error = key + " expects positive integer" + LineSuffix(line.line_number);
                return false;
            }
            handled = true;
            break;
        }
        if (handled) {
            continue;
        }

        for (const DoubleKey& entry : kDoubleKeys) {
            if (key != entry.key) {
                continue;
            }
            if (!ParseNonNegativeDouble(value, out_config.*entry.field)) {
                out_error = key + " expects non-negative number" + LineSuffix(line.line_number);
                return false;
            }
            handled = true;
            break;
        }
        if (handled) {
            continue;
        }

        if (key == "input_lead_ticks") {
            if (!cfg::ParseInt(value, out_config.input_lead_ticks) ||
                out_config.input_lead_ticks < 0) {
                out_error = "input_lead_ticks expects integer >= 0" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (key == "log_level") {
            LogLevel parsed_level = LogLevel::Info;
            if (!cfg::ParseQuotedString(value, out_config.log_level) ||
                !TryParseLogLevel(out_config.log_level, parsed_level)) {
                out_error =
                    "log_level expects one of \"debug\"|\"info\"|\"warn\"|\"error\"" +
                    LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (key == "window_title") {
            if (!cfg::ParseQuotedString(value, out_config.window_title)) {
                out_error = "window_title expects string" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (key == "vsync") {
            if (!cfg::ParseBool(value, out_config.vsync)) {
                out_error = "vsync expects boolean" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (key == "net_udp_local_host") {
            if (!cfg::ParseQuotedString(value, out_config.net_udp_local_host)) {
                out_error = "net_udp_local_host expects string" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (key == "net_udp_local_port") {
            if (!ParsePort(value, out_config.net_udp_local_port)) {
                out_error =
                    "net_udp_local_port expects integer in [0, 65535]" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (key == "net_udp_server_host") {
            if (!cfg::ParseQuotedString(value, out_config.net_udp_server_host)) {
                out_error = "net_udp_server_host expects string" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (key == "net_udp_server_port") {
            if (!ParsePort(value, out_config.net_udp_server_port)) {
                out_error =
                    "net_udp_server_port expects integer in [0, 65535]" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (key == "script_path") {
            if (!cfg::ParseQuotedString(value, out_config.script_path)) {
                out_error = "script_path expects string" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        Logger::Warn("config", "Ignoring unknown config key '" + key + "'" + LineSuffix(line.line_number));
    }

    return Validate(out_config, out_error);
}

bool ConfigLoader::Validate(const SyncConfig& config, std::string& out_error) {
    if (config.tick_rate_hz <= 0) {
        out_error = "tick_rate_hz must be > 0";
        return false;
    }

    if (config.ring_buffer_capacity <= 2 * config.max_round_trip_ticks) {
        out_error =
            "ring_buffer_capacity (" + std::to_string(config.ring_buffer_capacity) +
            ") must exceed twice max_round_trip_ticks (" +
            std::to_string(config.max_round_trip_ticks) + ")";
        return false;
    }

    if (config.correction_blend > 1.0) {
        out_error = "correction_blend must be within [0, 1]";
        return false;
    }

    if (config.hard_snap_threshold < config.position_error_threshold) {
        out_error = "hard_snap_threshold must be >= position_error_threshold";
        return false;
    }

    if (config.remote_min_interp_seconds <= 0.0 || config.ball_min_interp_seconds <= 0.0) {
        out_error = "interpolation minimum durations must be > 0";
        return false;
    }

    out_error.clear();
    return true;
}

}  // namespace pitchsync::core

#pragma once

#include "sim/input_sample.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace pitchsync::net {

enum class NetSessionState : std::uint8_t {
    Disconnected = 0,
    Connecting = 1,
    Connected = 2,
};

const char* NetSessionStateName(NetSessionState state);

struct InboundInput final {
    std::uint8_t player_slot = 0;
    sim::InputSample input{};
};

enum class PeerEventType : std::uint8_t {
    Joined = 0,
    Left = 1,
};

struct PeerEvent final {
    PeerEventType type = PeerEventType::Joined;
    std::uint8_t player_slot = 0;
    std::string reason;
};

struct NetDiagnosticsSnapshot final {
    NetSessionState session_state = NetSessionState::Disconnected;
    std::string last_session_transition_reason;
    std::size_t connected_peer_count = 0;
    std::uint64_t session_transition_count = 0;
    std::uint64_t connect_request_count = 0;
    std::uint64_t connect_probe_send_count = 0;
    std::uint64_t timeout_disconnect_count = 0;
    std::uint64_t manual_disconnect_count = 0;
    std::uint64_t rejected_full_count = 0;
    std::uint64_t ignored_unexpected_sender_count = 0;
    std::uint64_t decode_failure_count = 0;
    std::uint64_t received_datagram_count = 0;
    std::uint64_t sent_datagram_count = 0;
    std::uint64_t send_failure_count = 0;
    std::uint64_t unsent_disconnected_count = 0;
    std::uint64_t dropped_queue_full_count = 0;
    std::uint64_t ping_send_count = 0;
    std::uint64_t pong_receive_count = 0;
};

}  // namespace pitchsync::net

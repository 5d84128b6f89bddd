#include "net/server_net_service.h"

#include "core/logger.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace pitchsync::net {

ServerNetService::ServerNetService(ServerNetSettings settings)
    : settings_(std::move(settings)) {}

bool ServerNetService::Initialize(std::string& out_error) {
    peers_ = {};
    pending_inputs_.clear();
    pending_peer_events_.clear();
    diagnostics_ = {};
    diagnostics_.last_session_transition_reason = "initialize";

    if (!transport_.Open(settings_.bind_host, settings_.bind_port, out_error)) {
        initialized_ = false;
        return false;
    }

    initialized_ = true;
    out_error.clear();
    core::Logger::Info(
        "net",
        "Server listening on " + settings_.bind_host + ":" + std::to_string(transport_.LocalPort()) + ".");
    return true;
}

void ServerNetService::Shutdown() {
    if (!initialized_) {
        return;
    }

    const wire::ControlMessage goodbye{.type = wire::ControlType::Goodbye};
    for (std::uint8_t slot = 0; slot < sim::kMaxPlayers; ++slot) {
        if (peers_[slot].connected) {
            SendControlTo(peers_[slot].endpoint, goodbye);
            DisconnectSlot(slot, "shutdown");
        }
    }

    transport_.Close();
    initialized_ = false;
    core::Logger::Info("net", "Server net service shutdown.");
}

void ServerNetService::Tick(const core::TickContext& tick_context, double server_time_seconds) {
    if (!initialized_) {
        return;
    }

    server_time_seconds_ = server_time_seconds;
    DrainInboundDatagrams(tick_context.tick_index);
    ExpireSilentPeers(tick_context.tick_index);
}

std::vector<InboundInput> ServerNetService::ConsumeInputs() {
    std::vector<InboundInput> inputs = std::move(pending_inputs_);
    pending_inputs_.clear();
    return inputs;
}

std::vector<PeerEvent> ServerNetService::ConsumePeerEvents() {
    std::vector<PeerEvent> events = std::move(pending_peer_events_);
    pending_peer_events_.clear();
    return events;
}

void ServerNetService::SendOwnerState(std::uint8_t player_slot, const sim::CarState& state) {
    wire::ByteBuffer payload;
    wire::EncodeCarState(state, payload);
    SendToSlot(player_slot, wire::MessageKind::OwnerState, payload);
}

void ServerNetService::BroadcastRemoteCar(std::uint8_t player_slot, const sim::RemoteCarSnapshot& snapshot) {
    wire::ByteBuffer payload;
    wire::EncodeRemoteCar(
        wire::RemoteCarPayload{
            .player_slot = player_slot,
            .snapshot = snapshot,
        },
        payload);
    Broadcast(wire::MessageKind::RemoteCar, payload, player_slot);
}

void ServerNetService::BroadcastBall(const sim::BallState& ball) {
    wire::ByteBuffer payload;
    wire::EncodeBallState(ball, payload);
    Broadcast(wire::MessageKind::BallState, payload, -1);
}

void ServerNetService::BroadcastMatchStatus(const sim::MatchStatus& status) {
    wire::ByteBuffer payload;
    wire::EncodeMatchStatus(status, payload);
    Broadcast(wire::MessageKind::MatchStatus, payload, -1);
}

bool ServerNetService::IsSlotConnected(std::uint8_t player_slot) const {
    return player_slot < sim::kMaxPlayers && peers_[player_slot].connected;
}

std::size_t ServerNetService::ConnectedCount() const {
    std::size_t count = 0;
    for (const Peer& peer : peers_) {
        count += peer.connected ? 1 : 0;
    }
    return count;
}

std::uint16_t ServerNetService::LocalPort() const {
    return transport_.LocalPort();
}

NetDiagnosticsSnapshot ServerNetService::DiagnosticsSnapshot() const {
    NetDiagnosticsSnapshot snapshot = diagnostics_;
    snapshot.connected_peer_count = ConnectedCount();
    snapshot.session_state =
        snapshot.connected_peer_count > 0 ? NetSessionState::Connected : NetSessionState::Disconnected;
    return snapshot;
}

void ServerNetService::DrainInboundDatagrams(std::uint64_t tick_index) {
    wire::ByteBuffer datagram;
    UdpEndpoint sender{};
    std::string receive_error;
    while (transport_.Receive(datagram, sender, receive_error)) {
        ++diagnostics_.received_datagram_count;

        wire::EnvelopeView envelope{};
        std::string decode_error;
        if (!wire::TryDecodeEnvelopeV1(wire::ByteSpan(datagram.data(), datagram.size()), envelope, decode_error)) {
            ++diagnostics_.decode_failure_count;
            core::Logger::Debug("net", "Dropped datagram from " + EndpointText(sender) + ": " + decode_error);
            continue;
        }

        if (envelope.kind == wire::MessageKind::Control) {
            HandleControl(sender, envelope.payload, tick_index);
            continue;
        }

        const int slot = FindSlot(sender);
        if (slot < 0) {
            ++diagnostics_.ignored_unexpected_sender_count;
            continue;
        }
        peers_[slot].last_heard_tick = tick_index;

        if (envelope.kind == wire::MessageKind::Input) {
            HandleInput(static_cast<std::uint8_t>(slot), envelope.payload);
        } else {
            ++diagnostics_.ignored_unexpected_sender_count;
        }
    }

    if (!receive_error.empty()) {
        core::Logger::Warn("net", "UDP receive failed: " + receive_error);
    }
}

void ServerNetService::HandleControl(
    const UdpEndpoint& sender,
    wire::ByteSpan payload,
    std::uint64_t tick_index) {
    wire::ControlMessage message{};
    std::string decode_error;
    if (!wire::TryDecodeControl(payload, message, decode_error)) {
        ++diagnostics_.decode_failure_count;
        core::Logger::Debug("net", "Dropped control from " + EndpointText(sender) + ": " + decode_error);
        return;
    }

    int slot = FindSlot(sender);
    if (message.type == wire::ControlType::Hello) {
        if (slot < 0) {
            slot = FindFreeSlot();
            if (slot < 0) {
                ++diagnostics_.rejected_full_count;
                SendControlTo(sender, wire::ControlMessage{.type = wire::ControlType::Full});
                core::Logger::Warn("net", "Rejected " + EndpointText(sender) + ": server full.");
                return;
            }

            peers_[slot] = Peer{
                .connected = true,
                .endpoint = sender,
                .last_heard_tick = tick_index,
            };
            ++diagnostics_.session_transition_count;
            diagnostics_.last_session_transition_reason = "client_hello";
            pending_peer_events_.push_back(PeerEvent{
                .type = PeerEventType::Joined,
                .player_slot = static_cast<std::uint8_t>(slot),
                .reason = "client_hello",
            });
            core::Logger::Info(
                "net",
                "Client " + EndpointText(sender) + " joined as player " + std::to_string(slot + 1) + ".");
        }

        // Welcome is resent for repeated hellos; the first one may have been lost.
        peers_[slot].last_heard_tick = tick_index;
        SendControlTo(
            sender,
            wire::ControlMessage{
                .type = wire::ControlType::Welcome,
                .player_slot = static_cast<std::uint8_t>(slot),
                .tick_rate_hz = settings_.tick_rate_hz,
            });
        return;
    }

    if (slot < 0) {
        ++diagnostics_.ignored_unexpected_sender_count;
        return;
    }
    peers_[slot].last_heard_tick = tick_index;

    switch (message.type) {
        case wire::ControlType::Ping: {
            const double server_time_us = std::max(0.0, server_time_seconds_ * 1000000.0);
            SendControlTo(
                sender,
                wire::ControlMessage{
                    .type = wire::ControlType::Pong,
                    .client_time_us = message.client_time_us,
                    .server_time_us = static_cast<std::uint64_t>(std::llround(server_time_us)),
                });
            break;
        }
        case wire::ControlType::Goodbye:
            ++diagnostics_.manual_disconnect_count;
            DisconnectSlot(static_cast<std::uint8_t>(slot), "client_goodbye");
            break;
        case wire::ControlType::Hello:
        case wire::ControlType::Welcome:
        case wire::ControlType::Pong:
        case wire::ControlType::Full:
            ++diagnostics_.ignored_unexpected_sender_count;
            break;
    }
}

void ServerNetService::HandleInput(std::uint8_t player_slot, wire::ByteSpan payload) {
    sim::InputSample input{};
    std::string decode_error;
    if (!wire::TryDecodeInput(payload, input, decode_error)) {
        ++diagnostics_.decode_failure_count;
        core::Logger::Debug("net", "Dropped input from player " + std::to_string(player_slot + 1) + ": " + decode_error);
        return;
    }

    if (pending_inputs_.size() >= kMaxPendingInputs) {
        ++diagnostics_.dropped_queue_full_count;
        return;
    }

    pending_inputs_.push_back(InboundInput{
        .player_slot = player_slot,
        .input = input,
    });
}

void ServerNetService::ExpireSilentPeers(std::uint64_t tick_index) {
    for (std::uint8_t slot = 0; slot < sim::kMaxPlayers; ++slot) {
        const Peer& peer = peers_[slot];
        if (peer.connected &&
            peer.last_heard_tick != kInvalidTick &&
            tick_index > peer.last_heard_tick + kHeartbeatTimeoutTicks) {
            ++diagnostics_.timeout_disconnect_count;
            DisconnectSlot(slot, "heartbeat_timeout");
        }
    }
}

void ServerNetService::DisconnectSlot(std::uint8_t player_slot, std::string_view reason) {
    if (player_slot >= sim::kMaxPlayers || !peers_[player_slot].connected) {
        return;
    }

    core::Logger::Info(
        "net",
        "Player " + std::to_string(player_slot + 1) + " (" + EndpointText(peers_[player_slot].endpoint) +
            ") disconnected (" + std::string(reason) + ").");
    peers_[player_slot] = Peer{};
    ++diagnostics_.session_transition_count;
    diagnostics_.last_session_transition_reason = std::string(reason);
    pending_peer_events_.push_back(PeerEvent{
        .type = PeerEventType::Left,
        .player_slot = player_slot,
        .reason = std::string(reason),
    });
}

int ServerNetService::FindSlot(const UdpEndpoint& sender) const {
    for (std::size_t slot = 0; slot < peers_.size(); ++slot) {
        if (peers_[slot].connected && peers_[slot].endpoint == sender) {
            return static_cast<int>(slot);
        }
    }
    return -1;
}

int ServerNetService::FindFreeSlot() const {
    for (std::size_t slot = 0; slot < peers_.size(); ++slot) {
        if (!peers_[slot].connected) {
            return static_cast<int>(slot);
        }
    }
    return -1;
}

bool ServerNetService::SendControlTo(const UdpEndpoint& endpoint, const wire::ControlMessage& message) {
    wire::ByteBuffer payload;
    wire::EncodeControl(message, payload);
    return SendTo(endpoint, wire::MessageKind::Control, payload);
}

bool ServerNetService::SendTo(
    const UdpEndpoint& endpoint,
    wire::MessageKind kind,
    const wire::ByteBuffer& payload) {
    wire::ByteBuffer datagram;
    wire::EncodeEnvelopeV1(kind, wire::ByteSpan(payload.data(), payload.size()), datagram);

    std::string send_error;
    if (!transport_.SendTo(endpoint, wire::ByteSpan(datagram.data(), datagram.size()), send_error)) {
        ++diagnostics_.send_failure_count;
        core::Logger::Warn(
            "net",
            std::string("UDP ") + wire::MessageKindName(kind) + " send to " + EndpointText(endpoint) +
                " failed: " + send_error);
        return false;
    }

    ++diagnostics_.sent_datagram_count;
    return true;
}

void ServerNetService::SendToSlot(
    std::uint8_t player_slot,
    wire::MessageKind kind,
    const wire::ByteBuffer& payload) {
    if (!initialized_ || !IsSlotConnected(player_slot)) {
        ++diagnostics_.unsent_disconnected_count;
        return;
    }
    SendTo(peers_[player_slot].endpoint, kind, payload);
}

void ServerNetService::Broadcast(wire::MessageKind kind, const wire::ByteBuffer& payload, int skip_slot) {
    if (!initialized_) {
        return;
    }

    for (std::size_t slot = 0; slot < peers_.size(); ++slot) {
        if (static_cast<int>(slot) == skip_slot || !peers_[slot].connected) {
            continue;
        }
        SendTo(peers_[slot].endpoint, kind, payload);
    }
}

}  // namespace pitchsync::net

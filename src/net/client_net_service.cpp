#include "net/client_net_service.h"

#include "core/logger.h"

#include <algorithm>
#include <string>
#include <utility>

namespace pitchsync::net {

ClientNetService::ClientNetService(ClientNetSettings settings)
    : settings_(std::move(settings)) {}

ClientNetService::ClientNetService(ClientNetSettings settings, TimeSync::NowMicrosFn now_micros)
    : settings_(std::move(settings)),
      time_sync_(std::move(now_micros)) {}

void ClientNetService::TransitionSessionState(NetSessionState next_state, std::string_view reason) {
    if (session_state_ == next_state) {
        return;
    }

    const NetSessionState previous_state = session_state_;
    session_state_ = next_state;
    diagnostics_.last_session_transition_reason = std::string(reason);
    ++diagnostics_.session_transition_count;

    core::Logger::Info(
        "net",
        "Session transition: " +
            std::string(NetSessionStateName(previous_state)) +
            " -> " + std::string(NetSessionStateName(next_state)) +
            " (" + std::string(reason) + ").");
}

void ClientNetService::ResetSessionTracking() {
    has_player_slot_ = false;
    welcome_received_ = false;
    connect_started_tick_ = kInvalidTick;
    next_connect_probe_tick_ = kInvalidTick;
    connect_probe_interval_ticks_ = kConnectProbeIntervalTicks;
    last_heard_tick_ = kInvalidTick;
    last_ping_tick_ = kInvalidTick;
    pending_owner_states_.clear();
    pending_remote_cars_.clear();
    pending_ball_states_.clear();
    pending_match_statuses_.clear();
    time_sync_.Reset();
}

bool ClientNetService::Initialize(std::string& out_error) {
    session_state_ = NetSessionState::Disconnected;
    diagnostics_ = {};
    diagnostics_.last_session_transition_reason = "initialize";
    ResetSessionTracking();

    if (settings_.server.port == 0) {
        out_error = "server endpoint port must be non-zero";
        return false;
    }
    if (!transport_.Open(settings_.bind_host, settings_.bind_port, out_error)) {
        initialized_ = false;
        return false;
    }

    initialized_ = true;
    out_error.clear();
    core::Logger::Info(
        "net",
        "Client net service bound to " + settings_.bind_host + ":" + std::to_string(transport_.LocalPort()) +
            ", server=" + EndpointText(settings_.server) + ".");
    return true;
}

void ClientNetService::Shutdown() {
    if (!initialized_) {
        return;
    }

    RequestDisconnect();
    transport_.Close();
    initialized_ = false;
    core::Logger::Info("net", "Client net service shutdown.");
}

void ClientNetService::RequestConnect() {
    if (!initialized_ || session_state_ != NetSessionState::Disconnected) {
        return;
    }

    ResetSessionTracking();
    TransitionSessionState(NetSessionState::Connecting, "request_connect");
    ++diagnostics_.connect_request_count;
}

void ClientNetService::RequestDisconnect() {
    if (!initialized_ || session_state_ == NetSessionState::Disconnected) {
        return;
    }

    SendControl(wire::ControlMessage{.type = wire::ControlType::Goodbye});
    ++diagnostics_.manual_disconnect_count;
    TransitionSessionState(NetSessionState::Disconnected, "request_disconnect");
    ResetSessionTracking();
}

void ClientNetService::Tick(const core::TickContext& tick_context) {
    if (!initialized_) {
        return;
    }

    const std::uint64_t tick = tick_context.tick_index;
    DrainInboundDatagrams(tick);

    if (session_state_ == NetSessionState::Connecting) {
        if (connect_started_tick_ == kInvalidTick) {
            connect_started_tick_ = tick;
            next_connect_probe_tick_ = tick;
        }

        if (welcome_received_) {
            TransitionSessionState(NetSessionState::Connected, "server_welcome");
            last_heard_tick_ = tick;
            connect_probe_interval_ticks_ = kConnectProbeIntervalTicks;
        } else if (tick > connect_started_tick_ + kConnectTimeoutTicks) {
            ++diagnostics_.timeout_disconnect_count;
            TransitionSessionState(NetSessionState::Disconnected, "connect_timeout");
            ResetSessionTracking();
        } else if (tick >= next_connect_probe_tick_) {
            ++diagnostics_.connect_probe_send_count;
            SendControl(wire::ControlMessage{.type = wire::ControlType::Hello});
            next_connect_probe_tick_ = tick + connect_probe_interval_ticks_;
            connect_probe_interval_ticks_ = std::min(
                connect_probe_interval_ticks_ * 2,
                kMaxConnectProbeIntervalTicks);
        }
    }

    if (session_state_ != NetSessionState::Connected) {
        return;
    }

    if (last_heard_tick_ != kInvalidTick && tick > last_heard_tick_ + kHeartbeatTimeoutTicks) {
        ++diagnostics_.timeout_disconnect_count;
        TransitionSessionState(NetSessionState::Disconnected, "heartbeat_timeout");
        ResetSessionTracking();
        return;
    }

    // Pings double as the client's heartbeat.
    if (last_ping_tick_ == kInvalidTick || tick >= last_ping_tick_ + kPingIntervalTicks) {
        if (SendControl(wire::ControlMessage{
                .type = wire::ControlType::Ping,
                .client_time_us = time_sync_.NowMicros(),
            })) {
            ++diagnostics_.ping_send_count;
        }
        last_ping_tick_ = tick;
    }
}

void ClientNetService::SendInput(const sim::InputSample& input) {
    if (!initialized_ || session_state_ != NetSessionState::Connected) {
        ++diagnostics_.unsent_disconnected_count;
        return;
    }

    wire::ByteBuffer payload;
    wire::EncodeInput(input, payload);
    SendDatagram(wire::MessageKind::Input, payload);
}

std::vector<sim::CarState> ClientNetService::ConsumeOwnerStates() {
    std::vector<sim::CarState> states = std::move(pending_owner_states_);
    pending_owner_states_.clear();
    return states;
}

std::vector<wire::RemoteCarPayload> ClientNetService::ConsumeRemoteCars() {
    std::vector<wire::RemoteCarPayload> cars = std::move(pending_remote_cars_);
    pending_remote_cars_.clear();
    return cars;
}

std::vector<sim::BallState> ClientNetService::ConsumeBallStates() {
    std::vector<sim::BallState> balls = std::move(pending_ball_states_);
    pending_ball_states_.clear();
    return balls;
}

std::vector<sim::MatchStatus> ClientNetService::ConsumeMatchStatuses() {
    std::vector<sim::MatchStatus> statuses = std::move(pending_match_statuses_);
    pending_match_statuses_.clear();
    return statuses;
}

NetSessionState ClientNetService::SessionState() const {
    return session_state_;
}

bool ClientNetService::HasPlayerSlot() const {
    return has_player_slot_;
}

std::uint8_t ClientNetService::PlayerSlot() const {
    return player_slot_;
}

std::uint16_t ClientNetService::ServerTickRateHz() const {
    return server_tick_rate_hz_;
}

TimeSync& ClientNetService::Clock() {
    return time_sync_;
}

const TimeSync& ClientNetService::Clock() const {
    return time_sync_;
}

std::uint16_t ClientNetService::LocalPort() const {
    return transport_.LocalPort();
}

NetDiagnosticsSnapshot ClientNetService::DiagnosticsSnapshot() const {
    NetDiagnosticsSnapshot snapshot = diagnostics_;
    snapshot.session_state = session_state_;
    snapshot.connected_peer_count = session_state_ == NetSessionState::Connected ? 1 : 0;
    return snapshot;
}

template <typename T>
void ClientNetService::Enqueue(std::vector<T>& queue, T value) {
    if (queue.size() >= kMaxPendingSnapshots) {
        ++diagnostics_.dropped_queue_full_count;
        return;
    }
    queue.push_back(std::move(value));
}

void ClientNetService::DrainInboundDatagrams(std::uint64_t tick_index) {
    wire::ByteBuffer datagram;
    UdpEndpoint sender{};
    std::string receive_error;
    while (transport_.Receive(datagram, sender, receive_error)) {
        ++diagnostics_.received_datagram_count;
        if (!(sender == settings_.server)) {
            ++diagnostics_.ignored_unexpected_sender_count;
            continue;
        }

        wire::EnvelopeView envelope{};
        std::string decode_error;
        if (!wire::TryDecodeEnvelopeV1(wire::ByteSpan(datagram.data(), datagram.size()), envelope, decode_error)) {
            ++diagnostics_.decode_failure_count;
            core::Logger::Debug("net", "Dropped server datagram: " + decode_error);
            continue;
        }

        if (envelope.kind == wire::MessageKind::Control) {
            HandleControl(envelope.payload, tick_index);
            continue;
        }

        if (session_state_ != NetSessionState::Connected) {
            ++diagnostics_.unsent_disconnected_count;
            continue;
        }
        last_heard_tick_ = tick_index;

        bool decoded = false;
        switch (envelope.kind) {
            case wire::MessageKind::OwnerState: {
                sim::CarState state{};
                decoded = wire::TryDecodeCarState(envelope.payload, state, decode_error);
                if (decoded) {
                    Enqueue(pending_owner_states_, state);
                }
                break;
            }
            case wire::MessageKind::RemoteCar: {
                wire::RemoteCarPayload remote_car{};
                decoded = wire::TryDecodeRemoteCar(envelope.payload, remote_car, decode_error);
                if (decoded) {
                    Enqueue(pending_remote_cars_, remote_car);
                }
                break;
            }
            case wire::MessageKind::BallState: {
                sim::BallState ball{};
                decoded = wire::TryDecodeBallState(envelope.payload, ball, decode_error);
                if (decoded) {
                    Enqueue(pending_ball_states_, ball);
                }
                break;
            }
            case wire::MessageKind::MatchStatus: {
                sim::MatchStatus status{};
                decoded = wire::TryDecodeMatchStatus(envelope.payload, status, decode_error);
                if (decoded) {
                    Enqueue(pending_match_statuses_, status);
                }
                break;
            }
            case wire::MessageKind::Control:
            case wire::MessageKind::Input:
                decode_error = std::string("unexpected ") + wire::MessageKindName(envelope.kind) + " from server";
                break;
        }

        if (!decoded) {
            ++diagnostics_.decode_failure_count;
            core::Logger::Debug("net", "Dropped server payload: " + decode_error);
        }
    }

    if (!receive_error.empty()) {
        core::Logger::Warn("net", "UDP receive failed: " + receive_error);
    }
}

void ClientNetService::HandleControl(wire::ByteSpan payload, std::uint64_t tick_index) {
    wire::ControlMessage message{};
    std::string decode_error;
    if (!wire::TryDecodeControl(payload, message, decode_error)) {
        ++diagnostics_.decode_failure_count;
        core::Logger::Debug("net", "Dropped server control: " + decode_error);
        return;
    }

    last_heard_tick_ = tick_index;
    switch (message.type) {
        case wire::ControlType::Welcome:
            if (session_state_ == NetSessionState::Connecting && message.player_slot < sim::kMaxPlayers) {
                welcome_received_ = true;
                has_player_slot_ = true;
                player_slot_ = message.player_slot;
                server_tick_rate_hz_ = message.tick_rate_hz;
                core::Logger::Info(
                    "net",
                    "Welcome received: player " + std::to_string(player_slot_ + 1) + ", tick rate " +
                        std::to_string(server_tick_rate_hz_) + " Hz.");
            }
            break;
        case wire::ControlType::Pong:
            ++diagnostics_.pong_receive_count;
            time_sync_.AddSample(message.client_time_us, message.server_time_us, time_sync_.NowMicros());
            break;
        case wire::ControlType::Full:
            ++diagnostics_.rejected_full_count;
            TransitionSessionState(NetSessionState::Disconnected, "server_full");
            ResetSessionTracking();
            break;
        case wire::ControlType::Goodbye:
            TransitionSessionState(NetSessionState::Disconnected, "server_goodbye");
            ResetSessionTracking();
            break;
        case wire::ControlType::Hello:
        case wire::ControlType::Ping:
            ++diagnostics_.ignored_unexpected_sender_count;
            break;
    }
}

bool ClientNetService::SendControl(const wire::ControlMessage& message) {
    wire::ByteBuffer payload;
    wire::EncodeControl(message, payload);
    return SendDatagram(wire::MessageKind::Control, payload);
}

bool ClientNetService::SendDatagram(wire::MessageKind kind, const wire::ByteBuffer& payload) {
    wire::ByteBuffer datagram;
    wire::EncodeEnvelopeV1(kind, wire::ByteSpan(payload.data(), payload.size()), datagram);

    std::string send_error;
    if (!transport_.SendTo(settings_.server, wire::ByteSpan(datagram.data(), datagram.size()), send_error)) {
        ++diagnostics_.send_failure_count;
        core::Logger::Warn(
            "net",
            std::string("UDP ") + wire::MessageKindName(kind) + " send failed: " + send_error);
        return false;
    }

    ++diagnostics_.sent_datagram_count;
    return true;
}

}  // namespace pitchsync::net

#pragma once

#include "core/tick_context.h"
#include "net/net_service.h"
#include "net/time_sync.h"
#include "net/udp_transport.h"
#include "sim/entity_state.h"
#include "sim/match_world.h"
#include "sim/prediction_engine.h"
#include "wire/envelope.h"
#include "wire/payload_codec.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace pitchsync::net {

struct ClientNetSettings final {
    std::string bind_host = "127.0.0.1";
    std::uint16_t bind_port = 0;
    UdpEndpoint server{};
};

// Client side of the UDP session: handshake, ping-based clock estimation,
// input upload and inbound snapshot queues.
class ClientNetService final : public sim::IInputSink {
public:
    static constexpr std::size_t kMaxPendingSnapshots = 256;
    static constexpr std::uint64_t kHeartbeatTimeoutTicks = 180;
    static constexpr std::uint64_t kConnectProbeIntervalTicks = 30;
    static constexpr std::uint64_t kMaxConnectProbeIntervalTicks = 240;
    static constexpr std::uint64_t kConnectTimeoutTicks = 600;
    static constexpr std::uint64_t kPingIntervalTicks = 15;

    explicit ClientNetService(ClientNetSettings settings);
    ClientNetService(ClientNetSettings settings, TimeSync::NowMicrosFn now_micros);

    bool Initialize(std::string& out_error);
    void Shutdown();
    void RequestConnect();
    void RequestDisconnect();
    void Tick(const core::TickContext& tick_context);

    void SendInput(const sim::InputSample& input) override;

    std::vector<sim::CarState> ConsumeOwnerStates();
    std::vector<wire::RemoteCarPayload> ConsumeRemoteCars();
    std::vector<sim::BallState> ConsumeBallStates();
    std::vector<sim::MatchStatus> ConsumeMatchStatuses();

    NetSessionState SessionState() const;
    bool HasPlayerSlot() const;
    std::uint8_t PlayerSlot() const;
    std::uint16_t ServerTickRateHz() const;
    TimeSync& Clock();
    const TimeSync& Clock() const;
    std::uint16_t LocalPort() const;
    NetDiagnosticsSnapshot DiagnosticsSnapshot() const;

private:
    static constexpr std::uint64_t kInvalidTick = std::numeric_limits<std::uint64_t>::max();

    void TransitionSessionState(NetSessionState next_state, std::string_view reason);
    void ResetSessionTracking();
    void DrainInboundDatagrams(std::uint64_t tick_index);
    void HandleControl(wire::ByteSpan payload, std::uint64_t tick_index);
    template <typename T>
    void Enqueue(std::vector<T>& queue, T value);
    bool SendControl(const wire::ControlMessage& message);
    bool SendDatagram(wire::MessageKind kind, const wire::ByteBuffer& payload);

    ClientNetSettings settings_{};
    bool initialized_ = false;
    NetSessionState session_state_ = NetSessionState::Disconnected;
    UdpTransport transport_;
    TimeSync time_sync_;
    bool has_player_slot_ = false;
    std::uint8_t player_slot_ = 0;
    std::uint16_t server_tick_rate_hz_ = 0;
    bool welcome_received_ = false;
    std::uint64_t connect_started_tick_ = kInvalidTick;
    std::uint64_t next_connect_probe_tick_ = kInvalidTick;
    std::uint64_t connect_probe_interval_ticks_ = kConnectProbeIntervalTicks;
    std::uint64_t last_heard_tick_ = kInvalidTick;
    std::uint64_t last_ping_tick_ = kInvalidTick;
    std::vector<sim::CarState> pending_owner_states_;
    std::vector<wire::RemoteCarPayload> pending_remote_cars_;
    std::vector<sim::BallState> pending_ball_states_;
    std::vector<sim::MatchStatus> pending_match_statuses_;
    NetDiagnosticsSnapshot diagnostics_{};
};

}  // namespace pitchsync::net

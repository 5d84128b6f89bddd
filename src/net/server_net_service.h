#pragma once

#include "core/tick_context.h"
#include "net/net_service.h"
#include "net/udp_transport.h"
#include "sim/match_world.h"
#include "wire/envelope.h"
#include "wire/payload_codec.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace pitchsync::net {

struct ServerNetSettings final {
    std::string bind_host = "127.0.0.1";
    std::uint16_t bind_port = 0;
    std::uint16_t tick_rate_hz = 60;
};

// Authoritative side of the UDP session: admits up to two clients, queues
// their inputs and fans match state back out.
class ServerNetService final : public sim::IMatchBroadcastSink {
public:
    static constexpr std::size_t kMaxPendingInputs = 1024;
    static constexpr std::uint64_t kHeartbeatTimeoutTicks = 180;

    explicit ServerNetService(ServerNetSettings settings);

    bool Initialize(std::string& out_error);
    void Shutdown();

    // Drains the socket and expires silent clients. Server time is reported
    // in pongs for client clock estimation.
    void Tick(const core::TickContext& tick_context, double server_time_seconds);

    std::vector<InboundInput> ConsumeInputs();
    std::vector<PeerEvent> ConsumePeerEvents();

    void SendOwnerState(std::uint8_t player_slot, const sim::CarState& state) override;
    void BroadcastRemoteCar(std::uint8_t player_slot, const sim::RemoteCarSnapshot& snapshot) override;
    void BroadcastBall(const sim::BallState& ball) override;
    void BroadcastMatchStatus(const sim::MatchStatus& status) override;

    bool IsSlotConnected(std::uint8_t player_slot) const;
    std::size_t ConnectedCount() const;
    std::uint16_t LocalPort() const;
    NetDiagnosticsSnapshot DiagnosticsSnapshot() const;

private:
    static constexpr std::uint64_t kInvalidTick = std::numeric_limits<std::uint64_t>::max();

    struct Peer final {
        bool connected = false;
        UdpEndpoint endpoint{};
        std::uint64_t last_heard_tick = kInvalidTick;
    };

    void DrainInboundDatagrams(std::uint64_t tick_index);
    void HandleControl(const UdpEndpoint& sender, wire::ByteSpan payload, std::uint64_t tick_index);
    void HandleInput(std::uint8_t player_slot, wire::ByteSpan payload);
    void ExpireSilentPeers(std::uint64_t tick_index);
    void DisconnectSlot(std::uint8_t player_slot, std::string_view reason);
    int FindSlot(const UdpEndpoint& sender) const;
    int FindFreeSlot() const;
    bool SendControlTo(const UdpEndpoint& endpoint, const wire::ControlMessage& message);
    bool SendTo(const UdpEndpoint& endpoint, wire::MessageKind kind, const wire::ByteBuffer& payload);
    void SendToSlot(std::uint8_t player_slot, wire::MessageKind kind, const wire::ByteBuffer& payload);
    void Broadcast(wire::MessageKind kind, const wire::ByteBuffer& payload, int skip_slot);

    ServerNetSettings settings_{};
    bool initialized_ = false;
    UdpTransport transport_;
    std::array<Peer, sim::kMaxPlayers> peers_{};
    double server_time_seconds_ = 0.0;
    std::vector<InboundInput> pending_inputs_;
    std::vector<PeerEvent> pending_peer_events_;
    NetDiagnosticsSnapshot diagnostics_{};
};

}  // namespace pitchsync::net

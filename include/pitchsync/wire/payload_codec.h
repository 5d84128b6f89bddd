#pragma once

#include "sim/entity_state.h"
#include "sim/input_sample.h"
#include "sim/match_world.h"
#include "wire/byte_io.h"

#include <cstdint>
#include <string>

namespace pitchsync::wire {

// Every payload starts with this byte, followed by the tick and then the
// remaining fields in declaration order. Field sets are fixed per version.
inline constexpr std::uint8_t kPayloadSchemaV1 = 1;

enum class ControlType : std::uint8_t {
    Hello = 1,
    Welcome = 2,
    Ping = 3,
    Pong = 4,
    Goodbye = 5,
    Full = 6,
};

const char* ControlTypeName(ControlType type);

struct ControlMessage final {
    ControlType type = ControlType::Hello;
    // Welcome
    std::uint8_t player_slot = 0;
    std::uint16_t tick_rate_hz = 0;
    // Ping / Pong
    std::uint64_t client_time_us = 0;
    std::uint64_t server_time_us = 0;
};

struct RemoteCarPayload final {
    std::uint8_t player_slot = 0;
    sim::RemoteCarSnapshot snapshot{};
};

void EncodeControl(const ControlMessage& message, ByteBuffer& out_payload);
bool TryDecodeControl(ByteSpan payload, ControlMessage& out_message, std::string& out_error);

void EncodeInput(const sim::InputSample& input, ByteBuffer& out_payload);
bool TryDecodeInput(ByteSpan payload, sim::InputSample& out_input, std::string& out_error);

void EncodeCarState(const sim::CarState& state, ByteBuffer& out_payload);
bool TryDecodeCarState(ByteSpan payload, sim::CarState& out_state, std::string& out_error);

void EncodeRemoteCar(const RemoteCarPayload& remote_car, ByteBuffer& out_payload);
bool TryDecodeRemoteCar(ByteSpan payload, RemoteCarPayload& out_remote_car, std::string& out_error);

void EncodeBallState(const sim::BallState& ball, ByteBuffer& out_payload);
bool TryDecodeBallState(ByteSpan payload, sim::BallState& out_ball, std::string& out_error);

void EncodeMatchStatus(const sim::MatchStatus& status, ByteBuffer& out_payload);
bool TryDecodeMatchStatus(ByteSpan payload, sim::MatchStatus& out_status, std::string& out_error);

}  // namespace pitchsync::wire

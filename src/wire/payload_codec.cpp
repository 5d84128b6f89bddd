#include "wire/payload_codec.h"

namespace pitchsync::wire {
namespace {

constexpr Byte kInputBoost = 1U << 0U;
constexpr Byte kInputDrift = 1U << 1U;
constexpr Byte kInputAirRoll = 1U << 2U;
constexpr Byte kInputJump = 1U << 3U;
constexpr Byte kInputJumpPressed = 1U << 4U;
constexpr Byte kInputJumpReleased = 1U << 5U;
constexpr Byte kInputKnownFlags =
    kInputBoost | kInputDrift | kInputAirRoll | kInputJump | kInputJumpPressed | kInputJumpReleased;

void WriteVec3(ByteWriter& writer, const core::Vec3& value) {
    writer.WriteF32(value.x);
    writer.WriteF32(value.y);
    writer.WriteF32(value.z);
}

bool ReadVec3(ByteReader& reader, core::Vec3& out_value) {
    return reader.ReadF32(out_value.x) &&
        reader.ReadF32(out_value.y) &&
        reader.ReadF32(out_value.z);
}

void WriteQuat(ByteWriter& writer, const core::Quat& value) {
    writer.WriteF32(value.w);
    writer.WriteF32(value.x);
    writer.WriteF32(value.y);
    writer.WriteF32(value.z);
}

bool ReadQuat(ByteReader& reader, core::Quat& out_value) {
    return reader.ReadF32(out_value.w) &&
        reader.ReadF32(out_value.x) &&
        reader.ReadF32(out_value.y) &&
        reader.ReadF32(out_value.z);
}

void WriteHeader(ByteWriter& writer, sim::Tick tick) {
    writer.WriteU8(kPayloadSchemaV1);
    writer.WriteU32(tick);
}

bool ReadHeader(ByteReader& reader, const char* payload_name, sim::Tick& out_tick, std::string& out_error) {
    Byte schema_version = 0;
    if (!reader.ReadU8(schema_version)) {
        out_error = std::string(payload_name) + " payload missing schema version";
        return false;
    }
    if (schema_version != kPayloadSchemaV1) {
        out_error = std::string(payload_name) + " payload has unsupported schema version " +
            std::to_string(schema_version);
        return false;
    }
    if (!reader.ReadU32(out_tick) || out_tick == sim::kInvalidTick) {
        out_error = std::string(payload_name) + " payload missing tick";
        return false;
    }
    return true;
}

bool FinishDecode(const ByteReader& reader, const char* payload_name, std::string& out_error) {
    if (!reader.IsFullyConsumed()) {
        out_error = std::string(payload_name) + " payload has trailing bytes";
        return false;
    }

    out_error.clear();
    return true;
}

}  // namespace

const char* ControlTypeName(ControlType type) {
    switch (type) {
        case ControlType::Hello:
            return "hello";
        case ControlType::Welcome:
            return "welcome";
        case ControlType::Ping:
            return "ping";
        case ControlType::Pong:
            return "pong";
        case ControlType::Goodbye:
            return "goodbye";
        case ControlType::Full:
            return "full";
    }

    return "unknown";
}

void EncodeControl(const ControlMessage& message, ByteBuffer& out_payload) {
    ByteWriter writer;
    writer.WriteU8(kPayloadSchemaV1);
    writer.WriteU8(static_cast<Byte>(message.type));
    switch (message.type) {
        case ControlType::Welcome:
            writer.WriteU8(message.player_slot);
            writer.WriteU16(message.tick_rate_hz);
            break;
        case ControlType::Ping:
            writer.WriteU64(message.client_time_us);
            break;
        case ControlType::Pong:
            writer.WriteU64(message.client_time_us);
            writer.WriteU64(message.server_time_us);
            break;
        case ControlType::Hello:
        case ControlType::Goodbye:
        case ControlType::Full:
            break;
    }

    out_payload = writer.TakeBuffer();
}

bool TryDecodeControl(ByteSpan payload, ControlMessage& out_message, std::string& out_error) {
    out_message = {};

    ByteReader reader(payload);
    Byte schema_version = 0;
    if (!reader.ReadU8(schema_version) || schema_version != kPayloadSchemaV1) {
        out_error = "control payload has unsupported schema version";
        return false;
    }

    Byte type_u8 = 0;
    if (!reader.ReadU8(type_u8)) {
        out_error = "control payload missing type";
        return false;
    }

    out_message.type = static_cast<ControlType>(type_u8);
    bool fields_ok = true;
    switch (out_message.type) {
        case ControlType::Welcome:
            fields_ok = reader.ReadU8(out_message.player_slot) &&
                reader.ReadU16(out_message.tick_rate_hz);
            break;
        case ControlType::Ping:
            fields_ok = reader.ReadU64(out_message.client_time_us);
            break;
        case ControlType::Pong:
            fields_ok = reader.ReadU64(out_message.client_time_us) &&
                reader.ReadU64(out_message.server_time_us);
            break;
        case ControlType::Hello:
        case ControlType::Goodbye:
        case ControlType::Full:
            break;
        default:
            out_error = "control payload has unknown type";
            return false;
    }

    if (!fields_ok) {
        out_error = std::string("control ") + ControlTypeName(out_message.type) + " payload truncated";
        return false;
    }
    return FinishDecode(reader, "control", out_error);
}

void EncodeInput(const sim::InputSample& input, ByteBuffer& out_payload) {
    ByteWriter writer;
    WriteHeader(writer, input.tick);
    writer.WriteF32(input.throttle);
    writer.WriteF32(input.steer);
    writer.WriteF32(input.yaw);
    writer.WriteF32(input.pitch);
    writer.WriteF32(input.roll);

    Byte flags = 0;
    flags |= input.boost ? kInputBoost : 0;
    flags |= input.drift ? kInputDrift : 0;
    flags |= input.air_roll ? kInputAirRoll : 0;
    flags |= input.jump ? kInputJump : 0;
    flags |= input.jump_pressed ? kInputJumpPressed : 0;
    flags |= input.jump_released ? kInputJumpReleased : 0;
    writer.WriteU8(flags);

    out_payload = writer.TakeBuffer();
}

bool TryDecodeInput(ByteSpan payload, sim::InputSample& out_input, std::string& out_error) {
    out_input = {};

    ByteReader reader(payload);
    if (!ReadHeader(reader, "input", out_input.tick, out_error)) {
        return false;
    }

    Byte flags = 0;
    if (!reader.ReadF32(out_input.throttle) ||
        !reader.ReadF32(out_input.steer) ||
        !reader.ReadF32(out_input.yaw) ||
        !reader.ReadF32(out_input.pitch) ||
        !reader.ReadF32(out_input.roll) ||
        !reader.ReadU8(flags)) {
        out_error = "input payload truncated";
        return false;
    }
    if ((flags & ~kInputKnownFlags) != 0) {
        out_error = "input payload has unknown flags";
        return false;
    }

    out_input.boost = (flags & kInputBoost) != 0;
    out_input.drift = (flags & kInputDrift) != 0;
    out_input.air_roll = (flags & kInputAirRoll) != 0;
    out_input.jump = (flags & kInputJump) != 0;
    out_input.jump_pressed = (flags & kInputJumpPressed) != 0;
    out_input.jump_released = (flags & kInputJumpReleased) != 0;
    return FinishDecode(reader, "input", out_error);
}

void EncodeCarState(const sim::CarState& state, ByteBuffer& out_payload) {
    ByteWriter writer;
    WriteHeader(writer, state.tick);
    WriteVec3(writer, state.position);
    WriteQuat(writer, state.rotation);
    WriteVec3(writer, state.linear_velocity);
    WriteVec3(writer, state.angular_velocity);
    writer.WriteBool(state.can_drive);
    writer.WriteBool(state.all_wheels_on_surface);
    writer.WriteU8(state.wheels_on_surface_count);
    writer.WriteBool(state.body_on_surface);
    writer.WriteF32(state.forward_speed);
    writer.WriteF32(state.forward_speed_sign);
    writer.WriteF32(state.forward_speed_abs);
    writer.WriteU8(static_cast<Byte>(state.surface_state));
    writer.WriteBool(state.jumping);
    writer.WriteBool(state.can_first_jump);
    writer.WriteBool(state.can_keep_jumping);
    writer.WriteF32(state.jump_timer);
    writer.WriteF32(state.wheel_side_friction);

    out_payload = writer.TakeBuffer();
}

bool TryDecodeCarState(ByteSpan payload, sim::CarState& out_state, std::string& out_error) {
    out_state = {};

    ByteReader reader(payload);
    if (!ReadHeader(reader, "car_state", out_state.tick, out_error)) {
        return false;
    }

    Byte surface_state = 0;
    const bool fields_ok =
        ReadVec3(reader, out_state.position) &&
        ReadQuat(reader, out_state.rotation) &&
        ReadVec3(reader, out_state.linear_velocity) &&
        ReadVec3(reader, out_state.angular_velocity) &&
        reader.ReadBool(out_state.can_drive) &&
        reader.ReadBool(out_state.all_wheels_on_surface) &&
        reader.ReadU8(out_state.wheels_on_surface_count) &&
        reader.ReadBool(out_state.body_on_surface) &&
        reader.ReadF32(out_state.forward_speed) &&
        reader.ReadF32(out_state.forward_speed_sign) &&
        reader.ReadF32(out_state.forward_speed_abs) &&
        reader.ReadU8(surface_state) &&
        reader.ReadBool(out_state.jumping) &&
        reader.ReadBool(out_state.can_first_jump) &&
        reader.ReadBool(out_state.can_keep_jumping) &&
        reader.ReadF32(out_state.jump_timer) &&
        reader.ReadF32(out_state.wheel_side_friction);
    if (!fields_ok) {
        out_error = "car_state payload truncated or malformed";
        return false;
    }
    if (surface_state >= sim::kCarSurfaceStateCount) {
        out_error = "car_state payload has unknown surface state";
        return false;
    }
    if (out_state.wheels_on_surface_count > 4) {
        out_error = "car_state payload has invalid wheel count";
        return false;
    }

    out_state.surface_state = static_cast<sim::CarSurfaceState>(surface_state);
    return FinishDecode(reader, "car_state", out_error);
}

void EncodeRemoteCar(const RemoteCarPayload& remote_car, ByteBuffer& out_payload) {
    ByteWriter writer;
    WriteHeader(writer, remote_car.snapshot.tick);
    writer.WriteU8(remote_car.player_slot);
    WriteVec3(writer, remote_car.snapshot.position);
    WriteQuat(writer, remote_car.snapshot.rotation);
    WriteVec3(writer, remote_car.snapshot.linear_velocity);

    out_payload = writer.TakeBuffer();
}

bool TryDecodeRemoteCar(ByteSpan payload, RemoteCarPayload& out_remote_car, std::string& out_error) {
    out_remote_car = {};

    ByteReader reader(payload);
    if (!ReadHeader(reader, "remote_car", out_remote_car.snapshot.tick, out_error)) {
        return false;
    }

    if (!reader.ReadU8(out_remote_car.player_slot) ||
        !ReadVec3(reader, out_remote_car.snapshot.position) ||
        !ReadQuat(reader, out_remote_car.snapshot.rotation) ||
        !ReadVec3(reader, out_remote_car.snapshot.linear_velocity)) {
        out_error = "remote_car payload truncated";
        return false;
    }
    if (out_remote_car.player_slot >= sim::kMaxPlayers) {
        out_error = "remote_car payload has invalid player slot";
        return false;
    }
    return FinishDecode(reader, "remote_car", out_error);
}

void EncodeBallState(const sim::BallState& ball, ByteBuffer& out_payload) {
    ByteWriter writer;
    WriteHeader(writer, ball.tick);
    WriteVec3(writer, ball.position);
    WriteQuat(writer, ball.rotation);
    WriteVec3(writer, ball.linear_velocity);
    WriteVec3(writer, ball.angular_velocity);

    out_payload = writer.TakeBuffer();
}

bool TryDecodeBallState(ByteSpan payload, sim::BallState& out_ball, std::string& out_error) {
    out_ball = {};

    ByteReader reader(payload);
    if (!ReadHeader(reader, "ball_state", out_ball.tick, out_error)) {
        return false;
    }

    if (!ReadVec3(reader, out_ball.position) ||
        !ReadQuat(reader, out_ball.rotation) ||
        !ReadVec3(reader, out_ball.linear_velocity) ||
        !ReadVec3(reader, out_ball.angular_velocity)) {
        out_error = "ball_state payload truncated";
        return false;
    }
    return FinishDecode(reader, "ball_state", out_error);
}

void EncodeMatchStatus(const sim::MatchStatus& status, ByteBuffer& out_payload) {
    ByteWriter writer;
    WriteHeader(writer, status.tick);
    writer.WriteU8(static_cast<Byte>(status.phase));
    writer.WriteU16(status.score_player_one);
    writer.WriteU16(status.score_player_two);
    writer.WriteF32(status.remaining_seconds);
    writer.WriteU32(status.kickoff_count);

    out_payload = writer.TakeBuffer();
}

bool TryDecodeMatchStatus(ByteSpan payload, sim::MatchStatus& out_status, std::string& out_error) {
    out_status = {};

    ByteReader reader(payload);
    if (!ReadHeader(reader, "match_status", out_status.tick, out_error)) {
        return false;
    }

    Byte phase = 0;
    if (!reader.ReadU8(phase) ||
        !reader.ReadU16(out_status.score_player_one) ||
        !reader.ReadU16(out_status.score_player_two) ||
        !reader.ReadF32(out_status.remaining_seconds) ||
        !reader.ReadU32(out_status.kickoff_count)) {
        out_error = "match_status payload truncated";
        return false;
    }
    if (phase > static_cast<Byte>(sim::MatchPhase::Ended)) {
        out_error = "match_status payload has unknown phase";
        return false;
    }

    out_status.phase = static_cast<sim::MatchPhase>(phase);
    return FinishDecode(reader, "match_status", out_error);
}

}  // namespace pitchsync::wire

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace pitchsync::wire {

using Byte = std::uint8_t;
using ByteBuffer = std::vector<Byte>;
using ByteSpan = std::span<const Byte>;

// Fixed-width values are little-endian; floats travel as their IEEE-754 bits.
class ByteWriter final {
public:
    void Clear();
    const ByteBuffer& Buffer() const;
    ByteBuffer&& TakeBuffer();

    void WriteU8(Byte value);
    void WriteBool(bool value);
    void WriteU16(std::uint16_t value);
    void WriteU32(std::uint32_t value);
    void WriteU64(std::uint64_t value);
    void WriteF32(float value);
    void WriteVarUInt(std::uint64_t value);
    void WriteRawBytes(ByteSpan bytes);

private:
    ByteBuffer buffer_;
};

class ByteReader final {
public:
    explicit ByteReader(ByteSpan bytes);

    std::size_t Offset() const;
    std::size_t Remaining() const;
    bool IsFullyConsumed() const;

    bool ReadU8(Byte& out_value);
    // Rejects any byte other than 0 or 1.
    bool ReadBool(bool& out_value);
    bool ReadU16(std::uint16_t& out_value);
    bool ReadU32(std::uint32_t& out_value);
    bool ReadU64(std::uint64_t& out_value);
    // Rejects NaN and infinities.
    bool ReadF32(float& out_value);
    bool ReadVarUInt(std::uint64_t& out_value);
    bool ReadRawBytes(std::size_t length, ByteSpan& out_bytes);

private:
    bool ReadFixed(std::size_t width, std::uint64_t& out_value);

    ByteSpan bytes_;
    std::size_t offset_ = 0;
};

}  // namespace pitchsync::wire

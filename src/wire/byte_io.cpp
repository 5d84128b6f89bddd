#include "wire/byte_io.h"

#include <bit>
#include <cmath>
#include <utility>

namespace pitchsync::wire {

void ByteWriter::Clear() {
    buffer_.clear();
}

const ByteBuffer& ByteWriter::Buffer() const {
    return buffer_;
}

ByteBuffer&& ByteWriter::TakeBuffer() {
    return std::move(buffer_);
}

void ByteWriter::WriteU8(Byte value) {
    buffer_.push_back(value);
}

void ByteWriter::WriteBool(bool value) {
    buffer_.push_back(value ? 1 : 0);
}

void ByteWriter::WriteU16(std::uint16_t value) {
    buffer_.push_back(static_cast<Byte>(value & 0xFF));
    buffer_.push_back(static_cast<Byte>((value >> 8) & 0xFF));
}

void ByteWriter::WriteU32(std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        buffer_.push_back(static_cast<Byte>((value >> shift) & 0xFF));
    }
}

void ByteWriter::WriteU64(std::uint64_t value) {
    for (int shift = 0; shift < 64; shift += 8) {
        buffer_.push_back(static_cast<Byte>((value >> shift) & 0xFF));
    }
}

void ByteWriter::WriteF32(float value) {
    WriteU32(std::bit_cast<std::uint32_t>(value));
}

void ByteWriter::WriteVarUInt(std::uint64_t value) {
    while (value >= 0x80) {
        buffer_.push_back(static_cast<Byte>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    buffer_.push_back(static_cast<Byte>(value));
}

void ByteWriter::WriteRawBytes(ByteSpan bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

ByteReader::ByteReader(ByteSpan bytes) : bytes_(bytes) {}

std::size_t ByteReader::Offset() const {
    return offset_;
}

std::size_t ByteReader::Remaining() const {
    if (offset_ >= bytes_.size()) {
        return 0;
    }
    return bytes_.size() - offset_;
}

bool ByteReader::IsFullyConsumed() const {
    return offset_ == bytes_.size();
}

bool ByteReader::ReadU8(Byte& out_value) {
    if (offset_ >= bytes_.size()) {
        return false;
    }

    out_value = bytes_[offset_++];
    return true;
}

bool ByteReader::ReadBool(bool& out_value) {
    Byte value = 0;
    if (!ReadU8(value) || value > 1) {
        return false;
    }

    out_value = value == 1;
    return true;
}

bool ByteReader::ReadFixed(std::size_t width, std::uint64_t& out_value) {
    if (width > Remaining()) {
        return false;
    }

    out_value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        out_value |= static_cast<std::uint64_t>(bytes_[offset_ + i]) << (8 * i);
    }
    offset_ += width;
    return true;
}

bool ByteReader::ReadU16(std::uint16_t& out_value) {
    std::uint64_t value = 0;
    if (!ReadFixed(2, value)) {
        return false;
    }

    out_value = static_cast<std::uint16_t>(value);
    return true;
}

bool ByteReader::ReadU32(std::uint32_t& out_value) {
    std::uint64_t value = 0;
    if (!ReadFixed(4, value)) {
        return false;
    }

    out_value = static_cast<std::uint32_t>(value);
    return true;
}

bool ByteReader::ReadU64(std::uint64_t& out_value) {
    return ReadFixed(8, out_value);
}

bool ByteReader::ReadF32(float& out_value) {
    std::uint32_t bits = 0;
    if (!ReadU32(bits)) {
        return false;
    }

    const float value = std::bit_cast<float>(bits);
    if (!std::isfinite(value)) {
        return false;
    }

    out_value = value;
    return true;
}

bool ByteReader::ReadVarUInt(std::uint64_t& out_value) {
    out_value = 0;

    std::uint32_t shift = 0;
    for (int i = 0; i < 10; ++i) {
        Byte byte = 0;
        if (!ReadU8(byte)) {
            return false;
        }

        const std::uint64_t chunk = static_cast<std::uint64_t>(byte & 0x7F);
        if (shift >= 64 || (chunk << shift) >> shift != chunk) {
            return false;
        }

        out_value |= (chunk << shift);
        if ((byte & 0x80) == 0) {
            return true;
        }

        shift += 7;
    }

    return false;
}

bool ByteReader::ReadRawBytes(std::size_t length, ByteSpan& out_bytes) {
    if (length > Remaining()) {
        return false;
    }

    out_bytes = bytes_.subspan(offset_, length);
    offset_ += length;
    return true;
}

}  // namespace pitchsync::wire

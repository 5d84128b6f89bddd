#pragma once

#include "sim/tick.h"

#include <cstddef>
#include <vector>

namespace pitchsync::sim {

// Fixed-capacity storage indexed by `tick % capacity`. Every slot carries the
// tick it was written for; a read only succeeds when that stamp matches.
template <typename T>
class TickRingBuffer final {
public:
    explicit TickRingBuffer(std::size_t capacity = kDefaultTickBufferCapacity)
        : slots_(capacity == 0 ? 1 : capacity) {}

    std::size_t Capacity() const {
        return slots_.size();
    }

    void Clear() {
        for (Slot& slot : slots_) {
            slot = Slot{};
        }
    }

    void Store(Tick tick, const T& value) {
        if (tick == kInvalidTick) {
            return;
        }
        Slot& slot = slots_[IndexOf(tick)];
        slot.tick = tick;
        slot.value = value;
    }

    bool TryGet(Tick tick, T& out_value) const {
        const T* value = Find(tick);
        if (value == nullptr) {
            return false;
        }
        out_value = *value;
        return true;
    }

    const T* Find(Tick tick) const {
        if (tick == kInvalidTick) {
            return nullptr;
        }
        const Slot& slot = slots_[IndexOf(tick)];
        return slot.tick == tick ? &slot.value : nullptr;
    }

    bool Contains(Tick tick) const {
        return Find(tick) != nullptr;
    }

    Tick StampAt(Tick tick) const {
        return slots_[IndexOf(tick)].tick;
    }

private:
    struct Slot final {
        Tick tick = kInvalidTick;
        T value{};
    };

    std::size_t IndexOf(Tick tick) const {
        return static_cast<std::size_t>(tick) % slots_.size();
    }

    std::vector<Slot> slots_;
};

}  // namespace pitchsync::sim

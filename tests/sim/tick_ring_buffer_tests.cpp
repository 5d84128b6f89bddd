#include "sim/tick_ring_buffer.h"

#include <iostream>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

}  // namespace

int main() {
    using pitchsync::sim::kInvalidTick;
    using pitchsync::sim::TickRingBuffer;

    bool passed = true;

    TickRingBuffer<int> buffer(8);
    passed &= Expect(buffer.Capacity() == 8, "Capacity should match constructor argument.");
    passed &= Expect(!buffer.Contains(0), "Fresh buffer should not report tick 0 as stored.");
    passed &= Expect(buffer.StampAt(3) == kInvalidTick, "Fresh slots should carry the invalid stamp.");

    buffer.Store(3, 30);
    int value = 0;
    passed &= Expect(buffer.TryGet(3, value), "Stored tick should be readable.");
    passed &= Expect(value == 30, "Stored value should round-trip.");

    // Tick 11 maps onto the same slot as tick 3.
    passed &= Expect(buffer.Find(11) == nullptr, "A different tick in the same slot must not read back.");
    buffer.Store(11, 110);
    passed &= Expect(!buffer.TryGet(3, value), "Overwritten tick should no longer be readable.");
    passed &= Expect(buffer.TryGet(11, value) && value == 110, "Newer tick should own the slot.");
    passed &= Expect(buffer.StampAt(3) == 11, "Slot stamp should report the newest tick.");

    buffer.Store(kInvalidTick, 999);
    passed &= Expect(buffer.Find(kInvalidTick) == nullptr, "Invalid tick should never be stored or found.");

    buffer.Clear();
    passed &= Expect(!buffer.Contains(11), "Clear should drop every stamp.");

    TickRingBuffer<int> zero_capacity(0);
    passed &= Expect(zero_capacity.Capacity() == 1, "Zero capacity should clamp to one slot.");
    zero_capacity.Store(5, 50);
    passed &= Expect(zero_capacity.TryGet(5, value) && value == 50, "Single-slot buffer should still store.");

    TickRingBuffer<int> wide(1024);
    for (pitchsync::sim::Tick tick = 0; tick < 1024; ++tick) {
        wide.Store(tick, static_cast<int>(tick));
    }
    bool all_present = true;
    for (pitchsync::sim::Tick tick = 0; tick < 1024; ++tick) {
        all_present = all_present && wide.Contains(tick);
    }
    passed &= Expect(all_present, "A full window of ticks should stay readable.");
    wide.Store(1024, 1024);
    passed &= Expect(!wide.Contains(0), "Wrapping should evict the oldest tick.");
    passed &= Expect(wide.Contains(1), "Wrapping should evict exactly one tick.");

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] pitchsync_tick_ring_buffer_tests\n";
    return 0;
}

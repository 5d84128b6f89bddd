#include "net/time_sync.h"

#include <cmath>
#include <cstdint>
#include <iostream>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

bool NearlyEqual(double lhs, double rhs) {
    return std::fabs(lhs - rhs) < 1e-9;
}

}  // namespace

int main() {
    bool passed = true;

    std::uint64_t now_us = 3000;
    pitchsync::net::TimeSync sync([&now_us]() { return now_us; });

    passed &= Expect(!sync.IsSynchronized(), "Clock should not be synchronized before any pong.");
    passed &= Expect(!sync.AddSample(5000, 1000000, 4000), "Receive before send should be rejected.");
    passed &= Expect(!sync.IsSynchronized(), "Rejected sample should not synchronize.");

    // Ping sent at 1 ms, server stamped 5 s, pong received at 3 ms.
    passed &= Expect(sync.AddSample(1000, 5000000, 3000), "First sample should be accepted.");
    passed &= Expect(sync.IsSynchronized(), "One accepted sample should synchronize.");
    passed &= Expect(NearlyEqual(sync.SmoothedRttSeconds(), 0.002), "First sample should seed the round trip.");
    passed &= Expect(NearlyEqual(sync.OffsetSeconds(), 4.998), "Offset should include half the round trip.");
    passed &= Expect(
        NearlyEqual(sync.EstimatedServerSeconds(), 5.002),
        "Estimate should run half a round trip ahead of the server.");

    sync.SetLeadSeconds(0.05);
    passed &= Expect(NearlyEqual(sync.EstimatedServerSeconds(), 5.052), "Lead should move the estimate ahead.");
    sync.SetLeadSeconds(-1.0);
    passed &= Expect(NearlyEqual(sync.EstimatedServerSeconds(), 5.002), "Negative lead should clamp to zero.");

    now_us = 1003000;
    passed &= Expect(NearlyEqual(sync.EstimatedServerSeconds(), 6.002), "Estimate should follow the local clock.");

    passed &= Expect(!sync.AddSample(1000000, 6000000, 1500000), "Round trip far above the average should be rejected.");
    passed &= Expect(sync.RejectedSampleCount() == 2, "Rejected samples should be counted.");

    passed &= Expect(sync.AddSample(1001000, 6100000, 1005000), "Plausible sample should be accepted.");
    passed &= Expect(
        sync.SmoothedRttSeconds() > 0.002 && sync.SmoothedRttSeconds() < 0.004,
        "Round trip should move part of the way toward the new sample.");
    passed &= Expect(sync.AcceptedSampleCount() == 2, "Accepted samples should be counted.");

    sync.Reset();
    passed &= Expect(!sync.IsSynchronized(), "Reset should drop synchronization.");
    passed &= Expect(sync.AcceptedSampleCount() == 0, "Reset should clear the counters.");

    passed &= Expect(pitchsync::net::TimeSync::SteadyNowMicros() > 0, "Steady clock should report time.");

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] pitchsync_time_sync_tests\n";
    return 0;
}

#pragma once

#include "sim/tick_clock.h"

#include <cstddef>
#include <cstdint>
#include <functional>

namespace pitchsync::net {

// Estimates the server's simulation clock from ping/pong exchanges.
// EstimatedServerSeconds() runs ahead of the server by half the round trip
// plus a configurable lead, so inputs stamped with it arrive before the
// server reaches their tick.
class TimeSync final : public sim::ISyncedTimeSource {
public:
    using NowMicrosFn = std::function<std::uint64_t()>;

    static constexpr double kOffsetSmoothing = 0.1;
    static constexpr double kRttSmoothing = 0.125;
    static constexpr double kOutlierRttFactor = 2.0;
    static constexpr double kOutlierRttSlackSeconds = 0.010;

    TimeSync();
    explicit TimeSync(NowMicrosFn now_micros);

    static std::uint64_t SteadyNowMicros();

    void SetLeadSeconds(double lead_seconds);
    std::uint64_t NowMicros() const;

    // Returns false when the sample was rejected as an outlier or malformed.
    bool AddSample(std::uint64_t client_send_us, std::uint64_t server_time_us, std::uint64_t client_receive_us);
    void Reset();

    bool IsSynchronized() const override;
    double EstimatedServerSeconds() const override;

    double OffsetSeconds() const;
    double SmoothedRttSeconds() const;
    std::size_t AcceptedSampleCount() const;
    std::size_t RejectedSampleCount() const;

private:
    NowMicrosFn now_micros_;
    double lead_seconds_ = 0.0;
    double offset_seconds_ = 0.0;
    double smoothed_rtt_seconds_ = 0.0;
    std::size_t accepted_sample_count_ = 0;
    std::size_t rejected_sample_count_ = 0;
};

}  // namespace pitchsync::net

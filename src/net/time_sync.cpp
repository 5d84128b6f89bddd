#include "net/time_sync.h"

#include <chrono>
#include <utility>

namespace pitchsync::net {
namespace {

constexpr double kMicrosPerSecond = 1000000.0;

double ToSeconds(std::uint64_t micros) {
    return static_cast<double>(micros) / kMicrosPerSecond;
}

}  // namespace

TimeSync::TimeSync()
    : TimeSync(&TimeSync::SteadyNowMicros) {}

TimeSync::TimeSync(NowMicrosFn now_micros)
    : now_micros_(std::move(now_micros)) {}

std::uint64_t TimeSync::SteadyNowMicros() {
    const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count());
}

void TimeSync::SetLeadSeconds(double lead_seconds) {
    lead_seconds_ = lead_seconds > 0.0 ? lead_seconds : 0.0;
}

std::uint64_t TimeSync::NowMicros() const {
    return now_micros_ ? now_micros_() : SteadyNowMicros();
}

bool TimeSync::AddSample(
    std::uint64_t client_send_us,
    std::uint64_t server_time_us,
    std::uint64_t client_receive_us) {
    if (client_receive_us < client_send_us) {
        ++rejected_sample_count_;
        return false;
    }

    const double rtt = ToSeconds(client_receive_us - client_send_us);
    if (accepted_sample_count_ > 0 &&
        rtt > smoothed_rtt_seconds_ * kOutlierRttFactor + kOutlierRttSlackSeconds) {
        ++rejected_sample_count_;
        return false;
    }

    // The server stamped its clock roughly half a round trip before we received it.
    const double offset = ToSeconds(server_time_us) + rtt * 0.5 - ToSeconds(client_receive_us);
    if (accepted_sample_count_ == 0) {
        offset_seconds_ = offset;
        smoothed_rtt_seconds_ = rtt;
    } else {
        offset_seconds_ += (offset - offset_seconds_) * kOffsetSmoothing;
        smoothed_rtt_seconds_ += (rtt - smoothed_rtt_seconds_) * kRttSmoothing;
    }

    ++accepted_sample_count_;
    return true;
}

void TimeSync::Reset() {
    offset_seconds_ = 0.0;
    smoothed_rtt_seconds_ = 0.0;
    accepted_sample_count_ = 0;
    rejected_sample_count_ = 0;
}

bool TimeSync::IsSynchronized() const {
    return accepted_sample_count_ > 0;
}

double TimeSync::EstimatedServerSeconds() const {
    return ToSeconds(NowMicros()) + offset_seconds_ + smoothed_rtt_seconds_ * 0.5 + lead_seconds_;
}

double TimeSync::OffsetSeconds() const {
    return offset_seconds_;
}

double TimeSync::SmoothedRttSeconds() const {
    return smoothed_rtt_seconds_;
}

std::size_t TimeSync::AcceptedSampleCount() const {
    return accepted_sample_count_;
}

std::size_t TimeSync::RejectedSampleCount() const {
    return rejected_sample_count_;
}

}  // namespace pitchsync::net

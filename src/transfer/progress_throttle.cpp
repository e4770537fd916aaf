#include "transfer/progress_throttle.hpp"

namespace MediaShuttle::Transfer
{

ProgressThrottle::ProgressThrottle(std::chrono::milliseconds interval, double alpha)
    : interval_(interval), alpha_(alpha)
{
    Reset();
}

void ProgressThrottle::Reset(Clock::time_point start)
{
    last_sample_time_  = start;
    last_sample_bytes_ = 0;
    smoothed_rate_     = 0.0;
    has_rate_          = false;
    last_forward_time_.reset();
}

std::optional<ThroughputSample> ProgressThrottle::Update(
    std::uint64_t bytes_copied, std::uint64_t bytes_total, Clock::time_point now
)
{
    const std::chrono::duration<double> elapsed = now - last_sample_time_;
    if (elapsed.count() > 0.0 && bytes_copied >= last_sample_bytes_) {
        const double instant =
            static_cast<double>(bytes_copied - last_sample_bytes_) / elapsed.count();
        smoothed_rate_     = has_rate_ ? alpha_ * instant + (1.0 - alpha_) * smoothed_rate_ : instant;
        has_rate_          = true;
        last_sample_time_  = now;
        last_sample_bytes_ = bytes_copied;
    }

    const bool complete = bytes_copied >= bytes_total;
    const bool due      = !last_forward_time_.has_value() || now - *last_forward_time_ >= interval_;
    if (!complete && !due) {
        return std::nullopt;
    }

    last_forward_time_ = now;
    return ThroughputSample{bytes_copied, bytes_total, smoothed_rate_};
}

}  // namespace MediaShuttle::Transfer

#ifndef MEDIASHUTTLE_SRC_TRANSFER_PROGRESS_THROTTLE_HPP_
#define MEDIASHUTTLE_SRC_TRANSFER_PROGRESS_THROTTLE_HPP_

#include "app_constants.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace MediaShuttle::Transfer
{

struct ThroughputSample {
    std::uint64_t bytes_copied = 0;
    std::uint64_t bytes_total  = 0;
    double bytes_per_second    = 0.0;
};

// Tracks byte progress of one item and decides which updates are forwarded.
// Throughput is an exponential moving average updated on every chunk; an update
// is forwarded when it is the first one, when `interval` has passed since the
// last forwarded one, or when it reports completion.
class ProgressThrottle
{
    public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressThrottle(
        std::chrono::milliseconds interval = Constants::DEFAULT_PROGRESS_INTERVAL,
        double alpha                       = Constants::THROUGHPUT_EMA_ALPHA
    );

    // Starts a new item.
    void Reset(Clock::time_point start = Clock::now());

    std::optional<ThroughputSample> Update(
        std::uint64_t bytes_copied, std::uint64_t bytes_total, Clock::time_point now = Clock::now()
    );

    double GetBytesPerSecond() const { return smoothed_rate_; }

    private:
    const std::chrono::milliseconds interval_;
    const double alpha_;

    Clock::time_point last_sample_time_;
    std::uint64_t last_sample_bytes_ = 0;
    double smoothed_rate_            = 0.0;
    bool has_rate_                   = false;

    std::optional<Clock::time_point> last_forward_time_;
};

}  // namespace MediaShuttle::Transfer

#endif  // MEDIASHUTTLE_SRC_TRANSFER_PROGRESS_THROTTLE_HPP_

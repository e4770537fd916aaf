#ifndef MEDIASHUTTLE_SRC_CANCELLATION_TOKEN_HPP_
#define MEDIASHUTTLE_SRC_CANCELLATION_TOKEN_HPP_

#include <atomic>

namespace MediaShuttle
{

// Cooperative cancellation flag shared between a transfer and whoever owns its
// output stream. Work checks IsCancelled() at its own suspension points.
class CancellationToken
{
    public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&)            = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace MediaShuttle

#endif  // MEDIASHUTTLE_SRC_CANCELLATION_TOKEN_HPP_

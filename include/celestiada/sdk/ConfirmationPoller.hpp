#pragma once

#include "types.hpp"
#include "constants.hpp"
#include "CancellationToken.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace celestiada {
namespace sdk {

/**
 * @brief Blocking wait until an externally reported counter crosses a threshold
 *
 * Each attempt sleeps one interval and then reads the counter. Read errors
 * end the wait immediately; only "not there yet" is retried. Cancellation is
 * checked before every sleep and right after waking.
 */
class ConfirmationPoller {
public:
    using Reader = std::function<Result<uint64_t>(const CancellationToken&)>;
    using Condition = std::function<bool(uint64_t reported)>;

    enum class State {
        POLLING,
        SATISFIED
    };

    /**
     * @param name Label used in log lines
     * @param interval Delay between reads
     * @param max_attempts Upper bound on reads, 0 for unbounded
     */
    ConfirmationPoller(std::string name,
                       std::chrono::milliseconds interval = constants::DEFAULT_POLL_INTERVAL,
                       uint64_t max_attempts = 0);

    /**
     * @brief Poll until condition holds for the reported value
     * @return The value that satisfied the condition, CANCELLED, TIMEOUT, or the reader's error
     */
    Result<uint64_t> wait(const CancellationToken& ctx, const Reader& reader, const Condition& condition) const;

    // Satisfied once the reported height is >= target
    Result<uint64_t> wait_for_height(const CancellationToken& ctx, const Reader& current_height, uint64_t target) const;

    // Satisfied once the reported nonce is > target
    Result<uint64_t> wait_for_nonce(const CancellationToken& ctx, const Reader& current_nonce, uint64_t target) const;

    std::chrono::milliseconds interval() const { return interval_; }
    uint64_t max_attempts() const { return max_attempts_; }

private:
    std::string name_;
    std::chrono::milliseconds interval_;
    uint64_t max_attempts_;
};

} // namespace sdk
} // namespace celestiada

#include "celestiada/sdk/ConfirmationPoller.hpp"
#include "celestiada/sdk/Logger.hpp"
#include <utility>

namespace celestiada {
namespace sdk {

ConfirmationPoller::ConfirmationPoller(std::string name,
                                       std::chrono::milliseconds interval,
                                       uint64_t max_attempts)
    : name_(std::move(name)),
      interval_(interval),
      max_attempts_(max_attempts) {
}

Result<uint64_t> ConfirmationPoller::wait(const CancellationToken& ctx,
                                          const Reader& reader,
                                          const Condition& condition) const {
    State state = State::POLLING;
    uint64_t attempts = 0;
    uint64_t reported = 0;

    while (state == State::POLLING) {
        if (max_attempts_ != 0 && attempts >= max_attempts_) {
            Logger::instance().warning(name_ + ": gave up after " + std::to_string(attempts) +
                                       " attempts, last value " + std::to_string(reported));
            return {ErrorCode::TIMEOUT, name_};
        }

        if (ctx.is_cancelled()) {
            return {ErrorCode::CANCELLED, name_};
        }
        if (ctx.wait_for(interval_) || ctx.is_cancelled()) {
            return {ErrorCode::CANCELLED, name_};
        }

        auto current = reader(ctx);
        if (current.is_err()) {
            Logger::instance().warning(name_ + ": read failed: " + current.error_message());
            return current;
        }

        ++attempts;
        reported = current.value();
        if (condition(reported)) {
            state = State::SATISFIED;
        } else {
            Logger::instance().debug(name_ + ": condition not met at " + std::to_string(reported));
        }
    }

    return reported;
}

Result<uint64_t> ConfirmationPoller::wait_for_height(const CancellationToken& ctx,
                                                     const Reader& current_height,
                                                     uint64_t target) const {
    Logger::instance().debug(name_ + ": waiting for height " + std::to_string(target));
    return wait(ctx, current_height, [target](uint64_t height) { return height >= target; });
}

Result<uint64_t> ConfirmationPoller::wait_for_nonce(const CancellationToken& ctx,
                                                    const Reader& current_nonce,
                                                    uint64_t target) const {
    Logger::instance().debug(name_ + ": waiting for nonce above " + std::to_string(target));
    return wait(ctx, current_nonce, [target](uint64_t nonce) { return nonce > target; });
}

} // namespace sdk
} // namespace celestiada

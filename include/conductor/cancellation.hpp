#pragma once

#include "types.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace conductor {

/**
 * @brief Cancellation and deadline signal threaded from a pipeline run down to
 * every LLM and tool call.
 *
 * Copies share the same cancellation flag, so cancelling any copy cancels all
 * of them. A token may also carry a steady-clock deadline; derived tokens can
 * only tighten it.
 *
 * @threadsafety Safe to copy and query from any thread.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken()
        : cancelled_(std::make_shared<std::atomic<bool>>(false))
    {}

    /// Token that expires after the given duration.
    static CancellationToken with_timeout(std::chrono::milliseconds timeout) {
        CancellationToken token;
        token.deadline_ = Clock::now() + timeout;
        return token;
    }

    /**
     * @brief Derives a token sharing this token's flag with a deadline no later
     * than `timeout` from now.
     */
    [[nodiscard]] CancellationToken child(std::chrono::milliseconds timeout) const {
        CancellationToken token = *this;
        const auto candidate = Clock::now() + timeout;
        token.deadline_ = deadline_ ? std::min(*deadline_, candidate) : candidate;
        return token;
    }

    void cancel() const {
        cancelled_->store(true, std::memory_order_release);
    }

    bool is_cancelled() const {
        return cancelled_->load(std::memory_order_acquire);
    }

    bool is_expired() const {
        return deadline_.has_value() && Clock::now() >= *deadline_;
    }

    std::optional<Clock::time_point> deadline() const { return deadline_; }

    /**
     * @brief Reports whether the holder should stop.
     *
     * @return RequestCancelled if cancelled, RequestTimeout if the deadline
     *         passed, nullopt otherwise
     */
    std::optional<Error> check() const {
        if (is_cancelled()) {
            return Error{ErrorCode::RequestCancelled, "Operation cancelled"};
        }
        if (is_expired()) {
            return Error{ErrorCode::RequestTimeout, "Operation deadline exceeded"};
        }
        return std::nullopt;
    }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace conductor

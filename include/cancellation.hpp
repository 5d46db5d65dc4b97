/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation for long-running migrations.
 *
 * A token is shared between the caller and every remote call of one migration.
 * Blocking waits inside the pipeline go through the token so that a cancel request
 * or an expired deadline ends them promptly.
 */

#ifndef CANCELLATION_HPP
#define CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <optional>

/**
 * @brief Cancellation flag with an optional deadline.
 *
 * cancel() only performs a lock-free atomic store, so it may be called from a signal handler.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    /**
     * @brief Constructs a token that expires after the given budget.
     *
     * @param budget Time allowed before the token reports cancellation. Zero means no deadline.
     */
    explicit CancellationToken(std::chrono::milliseconds budget);

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief Sets the deadline relative to now. Call before the token is shared.
     *
     * @param budget Time allowed from now. Zero or negative removes the deadline.
     */
    void expireAfter(std::chrono::milliseconds budget);

    /**
     * @brief Requests cancellation.
     */
    void cancel() noexcept;

    /**
     * @brief Reports whether cancellation was requested or the deadline passed.
     */
    bool isCancelled() const noexcept;

    /**
     * @brief Reports whether the deadline (not an explicit cancel) ended the token.
     */
    bool deadlineExpired() const noexcept;

    /**
     * @brief Sleeps for the given duration unless cancelled first.
     *
     * Wakes at least every 50ms to observe cancel() calls.
     *
     * @param duration Time to wait.
     * @return bool True if the full duration elapsed, false if the token was cancelled.
     */
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;
};

#endif // CANCELLATION_HPP

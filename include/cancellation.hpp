#pragma once

#include <atomic>
#include <chrono>
#include <csignal>

/**
 * Cooperative cancellation shared by the sync orchestrator, the retry
 * controller and the transfer loop.
 *
 * The flag goes from clear to set exactly once and is never cleared; a new
 * run uses a new token. requestCancel() is async-signal-safe: it stores to a
 * lock-free atomic and writes one byte to a self-pipe, which wakes any
 * waitFor() in progress.
 */
class CancellationToken
{
public:
    CancellationToken();
    ~CancellationToken();

    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    /**
     * Set the flag. Calls after the first one have no effect.
     */
    void requestCancel() noexcept;

    bool isCancelled() const noexcept
    {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * Sleep for `duration` unless cancellation is requested first.
     *
     * @return true if the token is cancelled when the wait ends
     */
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    int wakeRead_ = -1;
    int wakeWrite_ = -1;
};

/**
 * Routes SIGINT and SIGTERM to a CancellationToken for its lifetime and
 * restores the previous handlers on destruction. Only one guard may be
 * active at a time.
 */
class SignalHandlerGuard
{
public:
    explicit SignalHandlerGuard(CancellationToken &token);
    ~SignalHandlerGuard();

    SignalHandlerGuard(const SignalHandlerGuard &) = delete;
    SignalHandlerGuard &operator=(const SignalHandlerGuard &) = delete;

private:
    struct sigaction previousInt_;
    struct sigaction previousTerm_;
};

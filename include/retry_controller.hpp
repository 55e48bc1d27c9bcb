#pragma once

#include "cancellation.hpp"
#include "transfer_error.hpp"

#include <chrono>
#include <functional>
#include <string>

struct RetryPolicy
{
    int maxAttempts = 3;                    // Total attempts, including the first one
    std::chrono::milliseconds delay{5000};  // Fixed wait between attempts
};

/**
 * Attempts spent on one logical operation.
 */
struct RetryBudget
{
    int maxAttempts = 3;
    std::chrono::milliseconds delay{5000};
    int attemptsUsed = 0;

    bool exhausted() const { return attemptsUsed >= maxAttempts; }
};

enum class RetryStatus
{
    Succeeded,
    Failed,   // Permanent error, or transient errors until the budget ran out
    Cancelled // Cancellation seen before an attempt or during a delay
};

struct RetryOutcome
{
    RetryStatus status = RetryStatus::Failed;
    int attempts = 0;
    int delays = 0;
    ErrorType lastErrorType = ErrorType::Unknown;
    std::string reason;
};

/**
 * Runs an operation with bounded retries on transient failure.
 *
 * Only TransferError is interpreted: permanent errors stop immediately
 * without spending retries, transient and unknown ones are retried after an
 * interruptible delay. Any other exception propagates to the caller.
 */
class RetryController
{
public:
    RetryController(const RetryPolicy &policy, const CancellationToken &token);

    RetryOutcome run(const std::function<void()> &attempt, const std::string &label) const;

private:
    RetryPolicy policy_;
    const CancellationToken &token_;
};

#include "retry_controller.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

RetryController::RetryController(const RetryPolicy &policy, const CancellationToken &token)
    : policy_(policy), token_(token)
{
}

RetryOutcome RetryController::run(const std::function<void()> &attempt, const std::string &label) const
{
    RetryBudget budget{policy_.maxAttempts, policy_.delay};
    RetryOutcome outcome;

    while (true)
    {
        if (token_.isCancelled())
        {
            spdlog::warn("Termination requested before attempt for {}", label);
            outcome.status = RetryStatus::Cancelled;
            return outcome;
        }

        ++budget.attemptsUsed;
        outcome.attempts = budget.attemptsUsed;

        try
        {
            attempt();
            outcome.status = RetryStatus::Succeeded;
            return outcome;
        }
        catch (const TransferError &e)
        {
            outcome.lastErrorType = e.type();
            outcome.reason = e.what();

            if (token_.isCancelled())
            {
                spdlog::warn("Termination requested during error handling for {}: {}", label, e.what());
                outcome.status = RetryStatus::Cancelled;
                return outcome;
            }

            if (!e.isRetryable())
            {
                spdlog::error("{} failed permanently: {}", label, e.what());
                outcome.status = RetryStatus::Failed;
                return outcome;
            }

            if (budget.exhausted())
            {
                spdlog::error("{} failed after {} attempts: {}", label, budget.attemptsUsed, e.what());
                outcome.status = RetryStatus::Failed;
                outcome.reason = fmt::format("{} (after {} attempts)", e.what(), budget.attemptsUsed);
                return outcome;
            }

            spdlog::warn("{} failed (attempt {}/{}): {}", label, budget.attemptsUsed, budget.maxAttempts, e.what());
            spdlog::info("Retrying in {:.1f} seconds...", std::chrono::duration<double>(budget.delay).count());
        }

        ++outcome.delays;
        if (token_.waitFor(budget.delay))
        {
            spdlog::warn("Termination requested while waiting to retry {}", label);
            outcome.status = RetryStatus::Cancelled;
            return outcome;
        }
    }
}

#include "cancellation.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace
{

// The signal handler's only way to reach the token owned by main()
std::atomic<CancellationToken *> signalTarget{nullptr};

void handleSignal(int)
{
    CancellationToken *token = signalTarget.load();
    if (token)
    {
        token->requestCancel();
    }
}

void setNonBlocking(int fd)
{
    int flags = ::fcntl(fd, F_GETFL);
    if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1 ||
        ::fcntl(fd, F_SETFD, FD_CLOEXEC) == -1)
    {
        throw std::system_error(errno, std::generic_category(), "fcntl on cancellation pipe");
    }
}

} // namespace

CancellationToken::CancellationToken()
{
    static_assert(std::atomic<bool>::is_always_lock_free,
                  "cancellation flag must be lock-free to be set from a signal handler");

    int fds[2];
    if (::pipe(fds) != 0)
    {
        throw std::system_error(errno, std::generic_category(), "Failed to create cancellation pipe");
    }
    wakeRead_ = fds[0];
    wakeWrite_ = fds[1];

    try
    {
        setNonBlocking(wakeRead_);
        setNonBlocking(wakeWrite_);
    }
    catch (...)
    {
        ::close(wakeRead_);
        ::close(wakeWrite_);
        throw;
    }
}

CancellationToken::~CancellationToken()
{
    ::close(wakeRead_);
    ::close(wakeWrite_);
}

void CancellationToken::requestCancel() noexcept
{
    if (cancelled_.exchange(true, std::memory_order_acq_rel))
    {
        return; // Already set
    }

    // The pipe is never drained, so every later waitFor() returns at once
    const char byte = 1;
    ssize_t written = ::write(wakeWrite_, &byte, 1);
    (void)written; // A full pipe already wakes the reader
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const
{
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + duration;

    while (!isCancelled())
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0)
        {
            break;
        }

        pollfd pfd{wakeRead_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0 && errno != EINTR)
        {
            throw std::system_error(errno, std::generic_category(), "poll on cancellation pipe");
        }
        // rc == 0: timed out, loop re-checks the deadline
        // rc > 0 or EINTR: the flag may have been set, loop re-checks it
    }

    return isCancelled();
}

SignalHandlerGuard::SignalHandlerGuard(CancellationToken &token)
{
    CancellationToken *expected = nullptr;
    if (!signalTarget.compare_exchange_strong(expected, &token))
    {
        throw std::logic_error("A signal handler guard is already installed");
    }

    struct sigaction action = {};
    action.sa_handler = handleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    if (::sigaction(SIGINT, &action, &previousInt_) != 0)
    {
        int error = errno;
        signalTarget.store(nullptr);
        throw std::system_error(error, std::generic_category(), "Failed to install SIGINT handler");
    }
    if (::sigaction(SIGTERM, &action, &previousTerm_) != 0)
    {
        int error = errno;
        ::sigaction(SIGINT, &previousInt_, nullptr);
        signalTarget.store(nullptr);
        throw std::system_error(error, std::generic_category(), "Failed to install SIGTERM handler");
    }
}

SignalHandlerGuard::~SignalHandlerGuard()
{
    ::sigaction(SIGINT, &previousInt_, nullptr);
    ::sigaction(SIGTERM, &previousTerm_, nullptr);
    signalTarget.store(nullptr);
}

#include "sync_types.hpp"

const char *toString(TransferState state)
{
    switch (state)
    {
    case TransferState::NotStarted:
        return "not started";
    case TransferState::InProgress:
        return "in progress";
    case TransferState::Paused:
        return "paused";
    case TransferState::Completed:
        return "completed";
    case TransferState::Failed:
        return "failed";
    }
    return "unknown";
}

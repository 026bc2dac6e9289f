#include "common/models.hpp"

#include <utility>

namespace auditray {

Status Status::checking()
{
    return Status{};
}

Status Status::upToDate()
{
    Status status;
    status.kind = StatusKind::UpToDate;
    return status;
}

Status Status::missingUpdates(std::vector<Update> updates)
{
    Status status;
    status.kind = StatusKind::MissingUpdates;
    status.updates = std::move(updates);
    return status;
}

Status Status::error(std::string message)
{
    Status status;
    status.kind = StatusKind::Error;
    status.message = std::move(message);
    return status;
}

bool operator==(const Update &a, const Update &b)
{
    return a.text == b.text && a.link == b.link;
}

bool operator==(const Status &a, const Status &b)
{
    return a.kind == b.kind && a.updates == b.updates && a.message == b.message;
}

CheckOutcome CheckOutcome::success(std::vector<Update> updates)
{
    CheckOutcome outcome;
    outcome.succeeded = true;
    outcome.updates = std::move(updates);
    return outcome;
}

CheckOutcome CheckOutcome::failure(std::string message)
{
    CheckOutcome outcome;
    outcome.succeeded = false;
    outcome.errorMessage = std::move(message);
    return outcome;
}

} // namespace auditray

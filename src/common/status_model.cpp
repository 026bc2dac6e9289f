#include "common/status_model.hpp"

#include <string>

namespace auditray {

namespace {

const char *const kCheckingText = "Checking...";
const char *const kUpToDateText = "No vulnerable packages";

} // namespace

Status classify(const CheckOutcome &outcome)
{
    if (!outcome.succeeded) {
        return Status::error(outcome.errorMessage.empty()
                                 ? std::string("unknown error")
                                 : outcome.errorMessage);
    }
    if (outcome.updates.empty()) {
        return Status::upToDate();
    }
    return Status::missingUpdates(outcome.updates);
}

Presentation present(const Status &status)
{
    switch (status.kind) {
    case StatusKind::Checking:
        return {kCheckingText, Icon::Check};
    case StatusKind::UpToDate:
        return {kUpToDateText, Icon::Check};
    case StatusKind::MissingUpdates: {
        const auto count = status.updates.size();
        if (count == 0) {
            return {kUpToDateText, Icon::Check};
        }
        if (count == 1) {
            return {"1 vulnerable package", Icon::Alert};
        }
        return {std::to_string(count) + " vulnerable packages", Icon::Alert};
    }
    case StatusKind::Error:
        return {"ERROR: " + status.message, Icon::Cross};
    }
    return {"ERROR: unknown status", Icon::Cross};
}

bool hasUpdateList(const Status &status)
{
    return status.kind == StatusKind::MissingUpdates && !status.updates.empty();
}

} // namespace auditray

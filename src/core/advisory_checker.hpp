#pragma once

#include <vector>

#include "common/models.hpp"

namespace auditray {

// The slow external check. Called only from the coordinator thread.
class AdvisoryChecker
{
public:
    virtual ~AdvisoryChecker() = default;

    // Returns the affected packages in the checker's own order.
    // Throws (typically CheckerError) when the check fails.
    virtual std::vector<Update> check() = 0;
};

} // namespace auditray

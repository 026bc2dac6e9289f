#pragma once

#include "common/models.hpp"

namespace auditray {

// Maps a checker outcome onto the closed set of statuses.
Status classify(const CheckOutcome &outcome);

// Display text and icon for a status. Total: every status yields non-empty
// text. MissingUpdates with no entries reads the same as UpToDate.
Presentation present(const Status &status);

// True when the tray should expand the status into a list of advisories.
bool hasUpdateList(const Status &status);

} // namespace auditray

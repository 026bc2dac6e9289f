#pragma once

namespace auditray {

// A request for a check. Carries no payload: triggers are interchangeable.
enum class TriggerEvent {
    Startup,
    FileChanged,
    UserClick
};

enum class StatusKind {
    Checking,
    UpToDate,
    MissingUpdates,
    Error
};

enum class Icon {
    Check,
    Alert,
    Cross
};

} // namespace auditray

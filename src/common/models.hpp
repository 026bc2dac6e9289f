#pragma once

#include <string>
#include <vector>

#include <QMetaType>

#include "common/enums.hpp"

namespace auditray {

// One advisory affecting an installed package.
struct Update {
    std::string text;
    std::string link;
};

/**
 * Status is the result of one completed check (or the transient "checking"
 * state shown by the tray). Construct through the named factories so that
 * the fields that do not belong to a kind stay empty.
 */
struct Status {
    StatusKind kind = StatusKind::Checking;
    std::vector<Update> updates;
    std::string message;

    static Status checking();
    static Status upToDate();
    static Status missingUpdates(std::vector<Update> updates);
    static Status error(std::string message);
};

bool operator==(const Update &a, const Update &b);
bool operator==(const Status &a, const Status &b);

// Raw result of a Checker invocation, before classification.
struct CheckOutcome {
    bool succeeded = false;
    std::vector<Update> updates;
    std::string errorMessage;

    static CheckOutcome success(std::vector<Update> updates);
    static CheckOutcome failure(std::string message);
};

struct Presentation {
    std::string text;
    Icon icon = Icon::Check;
};

} // namespace auditray

Q_DECLARE_METATYPE(auditray::Status)

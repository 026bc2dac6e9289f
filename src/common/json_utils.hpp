#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace auditray {

inline std::string toTriggerString(TriggerEvent event)
{
    switch (event) {
    case TriggerEvent::Startup:
        return "startup";
    case TriggerEvent::FileChanged:
        return "file_changed";
    case TriggerEvent::UserClick:
        return "user_click";
    }
    return "startup";
}

inline std::string toStatusKindString(StatusKind kind)
{
    switch (kind) {
    case StatusKind::Checking:
        return "checking";
    case StatusKind::UpToDate:
        return "up_to_date";
    case StatusKind::MissingUpdates:
        return "missing_updates";
    case StatusKind::Error:
        return "error";
    }
    return "error";
}

inline std::string toIconName(Icon icon)
{
    switch (icon) {
    case Icon::Check:
        return "check";
    case Icon::Alert:
        return "alert";
    case Icon::Cross:
        return "cross";
    }
    return "cross";
}

inline std::optional<Icon> parseIconName(const std::string &value)
{
    if (value == "check") {
        return Icon::Check;
    }
    if (value == "alert") {
        return Icon::Alert;
    }
    if (value == "cross") {
        return Icon::Cross;
    }
    return std::nullopt;
}

inline void to_json(nlohmann::json &j, const TriggerEvent &event)
{
    j = toTriggerString(event);
}

inline void to_json(nlohmann::json &j, const Icon &icon)
{
    j = toIconName(icon);
}

inline void to_json(nlohmann::json &j, const Update &update)
{
    j = nlohmann::json{{"text", update.text}, {"link", update.link}};
}

inline void to_json(nlohmann::json &j, const Status &status)
{
    j = nlohmann::json{
        {"kind", toStatusKindString(status.kind)},
        {"updates", status.updates},
        {"message", status.message}
    };
}

} // namespace auditray

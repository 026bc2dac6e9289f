#include "core/arch_audit_parser.hpp"

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"

namespace auditray {

namespace {

const char *const kAdvisoryBaseUrl = "https://security.archlinux.org/";

[[noreturn]] void malformed(const std::string &detail)
{
    throw CheckerError("malformed arch-audit output: " + detail);
}

std::string optionalString(const nlohmann::json &entry, const char *key,
                           std::size_t index)
{
    auto it = entry.find(key);
    if (it == entry.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        malformed("entry " + std::to_string(index) + ": \"" + key
                  + "\" is not a string");
    }
    return it->get<std::string>();
}

std::string joinPackages(const nlohmann::json &packages, std::size_t index)
{
    std::string joined;
    for (const auto &package : packages) {
        if (!package.is_string()) {
            malformed("entry " + std::to_string(index)
                      + ": package names must be strings");
        }
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += package.get<std::string>();
    }
    return joined;
}

// arch-audit only emits AVG identifiers; anything else must not end up in a
// URL the user can click.
bool isAdvisoryName(const std::string &name)
{
    const std::string prefix = "AVG-";
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    for (std::size_t i = prefix.size(); i < name.size(); ++i) {
        if (name[i] < '0' || name[i] > '9') {
            return false;
        }
    }
    return true;
}

Update toUpdate(const nlohmann::json &entry, std::size_t index)
{
    if (!entry.is_object()) {
        malformed("entry " + std::to_string(index) + " is not an object");
    }

    auto name = entry.find("name");
    if (name == entry.end() || !name->is_string()) {
        malformed("entry " + std::to_string(index) + " has no advisory name");
    }
    const std::string avg = name->get<std::string>();
    if (!isAdvisoryName(avg)) {
        malformed("entry " + std::to_string(index) + ": unexpected advisory name \""
                  + avg + "\"");
    }

    auto packages = entry.find("packages");
    if (packages == entry.end() || !packages->is_array() || packages->empty()) {
        malformed("entry " + std::to_string(index) + " (" + avg
                  + ") lists no packages");
    }

    const std::string severity = optionalString(entry, "severity", index);
    const std::string type = optionalString(entry, "type", index);
    const std::string fixed = optionalString(entry, "fixed", index);

    Update update;
    update.text = joinPackages(*packages, index) + " (" + avg + ")";
    if (!severity.empty() || !type.empty()) {
        update.text += ":";
        if (!severity.empty()) {
            update.text += " " + severity;
        }
        if (!severity.empty() && !type.empty()) {
            update.text += " -";
        }
        if (!type.empty()) {
            update.text += " " + type;
        }
    }
    if (!fixed.empty()) {
        update.text += " [fixed in " + fixed + "]";
    }
    update.link = advisoryLink(avg);
    return update;
}

} // namespace

std::string advisoryLink(const std::string &avgName)
{
    return kAdvisoryBaseUrl + avgName;
}

std::vector<Update> parseArchAuditJson(const std::string &output)
{
    // arch-audit prints nothing at all when no package is affected.
    if (output.find_first_not_of(" \t\r\n") == std::string::npos) {
        return {};
    }

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(output);
    } catch (const nlohmann::json::parse_error &ex) {
        malformed(ex.what());
    }

    if (!root.is_array()) {
        malformed("expected a JSON array");
    }

    std::vector<Update> updates;
    updates.reserve(root.size());
    for (std::size_t i = 0; i < root.size(); ++i) {
        updates.push_back(toUpdate(root.at(i), i));
    }
    return updates;
}

} // namespace auditray

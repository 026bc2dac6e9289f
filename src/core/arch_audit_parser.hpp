#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace auditray {

/**
 * Parse the output of `arch-audit --json`.
 *
 * The document is an array of advisory groups, each with at least a string
 * "name" (the AVG identifier) and an array of affected "packages". Each group
 * becomes one Update, in document order:
 *
 *   text: "<packages> (<AVG>): <severity> - <type> [fixed in <version>]"
 *   link: "https://security.archlinux.org/<AVG>"
 *
 * Optional fields that are missing or null are left out of the text. Empty
 * output means no affected packages.
 * Throws CheckerError on anything else.
 */
std::vector<Update> parseArchAuditJson(const std::string &output);

std::string advisoryLink(const std::string &avgName);

} // namespace auditray

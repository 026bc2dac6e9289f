#pragma once

#include <string>

#include <QString>

#include "common/icon_theme.hpp"

namespace auditray {

struct Config {
    IconTheme iconTheme = IconTheme::defaultTheme();
    std::string checkerProgram = "arch-audit";
    bool upgradableOnly = true;
    std::string watchPath = "/var/lib/pacman/local";
};

// Parse a JSON config document. Unknown keys are ignored.
// Throws ConfigError on malformed JSON or a key of the wrong type; an invalid
// icon_theme falls back to the default theme with a warning.
Config parseConfig(const std::string &jsonText, const QString &origin);

// Read and parse the file at path. Throws ConfigError if it cannot be read.
Config loadConfigFile(const QString &path);

// Config lookup order: explicitPath (if non-empty), the user config file, the
// system config file, built-in defaults.
Config loadConfig(const QString &explicitPath);

QString userConfigPath();
QString systemConfigPath();

} // namespace auditray

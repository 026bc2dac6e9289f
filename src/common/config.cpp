#include "common/config.hpp"

#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace auditray {

namespace {

std::string requireString(const nlohmann::json &root, const char *key,
                          const std::string &fallback, const QString &origin)
{
    auto it = root.find(key);
    if (it == root.end()) {
        return fallback;
    }
    if (!it->is_string()) {
        throw ConfigError(origin.toStdString() + ": \"" + key
                          + "\" must be a string");
    }
    return it->get<std::string>();
}

bool requireBool(const nlohmann::json &root, const char *key, bool fallback,
                 const QString &origin)
{
    auto it = root.find(key);
    if (it == root.end()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        throw ConfigError(origin.toStdString() + ": \"" + key
                          + "\" must be a boolean");
    }
    return it->get<bool>();
}

} // namespace

Config parseConfig(const std::string &jsonText, const QString &origin)
{
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(jsonText);
    } catch (const nlohmann::json::parse_error &ex) {
        throw ConfigError(origin.toStdString() + ": " + ex.what());
    }
    if (!root.is_object()) {
        throw ConfigError(origin.toStdString() + ": top level must be an object");
    }

    Config config;
    config.checkerProgram =
        requireString(root, "checker_program", config.checkerProgram, origin);
    config.upgradableOnly =
        requireBool(root, "upgradable_only", config.upgradableOnly, origin);
    config.watchPath = requireString(root, "watch_path", config.watchPath, origin);

    if (config.checkerProgram.empty()) {
        throw ConfigError(origin.toStdString() + ": \"checker_program\" is empty");
    }
    if (config.watchPath.empty()) {
        throw ConfigError(origin.toStdString() + ": \"watch_path\" is empty");
    }

    const std::string rawTheme = requireString(
        root, "icon_theme", config.iconTheme.name(), origin);
    try {
        config.iconTheme = IconTheme::parse(rawTheme);
    } catch (const ValidationError &ex) {
        ALOG_WARN(QStringLiteral("Config"),
                  QStringLiteral("icon_theme_rejected"),
                  (nlohmann::json{{"origin", origin.toStdString()},
                                  {"error", ex.what()},
                                  {"fallback", IconTheme::defaultTheme().name()}}));
        config.iconTheme = IconTheme::defaultTheme();
    }

    return config;
}

Config loadConfigFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        throw ConfigError("cannot read " + path.toStdString() + ": "
                          + file.errorString().toStdString());
    }
    const QByteArray content = file.readAll();
    return parseConfig(content.toStdString(), path);
}

QString userConfigPath()
{
    QString base = qEnvironmentVariable("XDG_CONFIG_HOME");
    if (base.isEmpty()) {
        const QString home = qEnvironmentVariable("HOME");
        if (home.isEmpty()) {
            return QString();
        }
        base = home + QStringLiteral("/.config");
    }
    return base + QStringLiteral("/auditray/config.json");
}

QString systemConfigPath()
{
    return QStringLiteral("/etc/auditray/config.json");
}

Config loadConfig(const QString &explicitPath)
{
    if (!explicitPath.isEmpty()) {
        return loadConfigFile(explicitPath);
    }

    for (const QString &candidate : {userConfigPath(), systemConfigPath()}) {
        if (!candidate.isEmpty() && QFileInfo::exists(candidate)) {
            ALOG_INFO(QStringLiteral("Config"),
                      QStringLiteral("config_file_found"),
                      (nlohmann::json{{"path", candidate.toStdString()}}));
            return loadConfigFile(candidate);
        }
    }

    ALOG_INFO(QStringLiteral("Config"),
              QStringLiteral("config_defaults"),
              nlohmann::json::object());
    return Config{};
}

} // namespace auditray

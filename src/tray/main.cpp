#include <QApplication>
#include <QCommandLineParser>
#include <QSystemTrayIcon>

#include <cstdio>
#include <exception>
#include <memory>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/arch_audit_checker.hpp"
#include "core/coordinator.hpp"
#include "core/package_db_watcher.hpp"
#include "core/status_bridge.hpp"
#include "core/trigger_channel.hpp"
#include "tray/AuditTray.hpp"
#include "tray/IconLocator.hpp"

namespace {

int fatal(const QString &what, const std::string &detail)
{
    ALOG_ERROR(QStringLiteral("main"), what, (nlohmann::json{{"error", detail}}));
    std::fprintf(stderr, "auditray: %s\n", detail.c_str());
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("auditray"));
    app.setQuitOnLastWindowClosed(false);

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Tray notifier for security advisories affecting installed packages."));
    parser.addHelpOption();
    QCommandLineOption verboseOption(QStringList() << "v" << "verbose",
                                     "Write debug logging and echo log lines to stderr.");
    QCommandLineOption configOption(QStringList() << "c" << "config",
                                    "Read configuration from <path>.", "path");
    QCommandLineOption debugIconOption(QStringList() << "debug-icon",
                                       "Only show the tray with <icon> (check, alert, cross).",
                                       "icon");
    parser.addOption(verboseOption);
    parser.addOption(configOption);
    parser.addOption(debugIconOption);
    parser.process(app);

    const bool verbose = parser.isSet(verboseOption)
        || qEnvironmentVariableIntValue("AUDITRAY_VERBOSE") == 1;
    auditray::logging::initLogging(QStringLiteral("auditray"), verbose);
    ALOG_INFO(QStringLiteral("main"),
              QStringLiteral("tray_start"),
              (nlohmann::json{{"verbose", verbose}}));

    auditray::Config config;
    try {
        config = auditray::loadConfig(parser.value(configOption));
    } catch (const auditray::ConfigError &ex) {
        return fatal(QStringLiteral("config_failed"), ex.what());
    }

    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        return fatal(QStringLiteral("tray_unavailable"), "system tray not available");
    }

    // Only the validated theme value ever reaches a path join.
    auditray::IconLocator icons(
        auditray::resolveIconThemeDir(config.iconTheme,
                                      auditray::defaultIconSearchRoots()));

    if (parser.isSet(debugIconOption)) {
        const std::string raw = parser.value(debugIconOption).toStdString();
        const auto icon = auditray::parseIconName(raw);
        if (!icon) {
            return fatal(QStringLiteral("invalid_icon"),
                         "Invalid icon name: \"" + raw + "\"");
        }
        auditray::AuditTray preview(icons, nullptr, *icon);
        return app.exec();
    }

    auditray::TriggerChannel triggers;
    auditray::StatusBridge bridge;

    auditray::PackageDbWatcher watcher(QString::fromStdString(config.watchPath),
                                       triggers);
    if (!watcher.start()) {
        return fatal(QStringLiteral("watcher_failed"),
                     "cannot watch " + config.watchPath);
    }

    auditray::ArchAuditChecker checker(config.checkerProgram, config.upgradableOnly);
    auditray::Coordinator coordinator(triggers, checker, bridge);

    auditray::AuditTray tray(icons, &triggers, auditray::Icon::Check);
    QObject::connect(&bridge, &auditray::StatusBridge::statusReady,
                     &tray, &auditray::AuditTray::applyStatus);
    QObject::connect(&app, &QCoreApplication::aboutToQuit,
                     [&coordinator]() { coordinator.stop(); });

    coordinator.start();
    triggers.send(auditray::TriggerEvent::Startup);

    return app.exec();
}

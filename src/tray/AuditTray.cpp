#include "tray/AuditTray.hpp"

#include <QAction>
#include <QCoreApplication>
#include <QDesktopServices>
#include <QUrl>

#include <utility>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/status_model.hpp"

namespace auditray {

namespace {

const char *const kCheckForUpdates = "Check for updates";
const char *const kChecking = "Checking...";
const char *const kStarting = "Starting...";
const char *const kQuit = "Quit";

} // namespace

AuditTray::AuditTray(IconLocator icons, TriggerChannel *triggers, Icon initialIcon,
                     QObject *parent)
    : QObject(parent)
    , m_icons(std::move(icons))
    , m_triggers(triggers)
{
    setupMenu();
    setIcon(initialIcon);
    m_trayIcon.setToolTip(QStringLiteral("Auditray"));
    m_trayIcon.show();
}

AuditTray::~AuditTray()
{
    clearUpdateMenu();
    m_trayIcon.setContextMenu(nullptr);
}

void AuditTray::setupMenu()
{
    if (m_triggers) {
        m_checkAction = m_menu.addAction(QString::fromUtf8(kCheckForUpdates));
        connect(m_checkAction, &QAction::triggered, this, &AuditTray::requestCheck);

        m_statusAction = m_menu.addAction(QString::fromUtf8(kStarting));
        m_menu.addSeparator();
    }

    // Always last, also in the icon preview menu.
    m_quitAction = m_menu.addAction(QString::fromUtf8(kQuit));
    connect(m_quitAction, &QAction::triggered, qApp, &QCoreApplication::quit);

    m_trayIcon.setContextMenu(&m_menu);
}

void AuditTray::requestCheck()
{
    if (!m_triggers) {
        return;
    }

    // Reflect the click right away; the coordinator may still be busy.
    m_checkAction->setText(QString::fromUtf8(kChecking));
    ALOG_INFO(QStringLiteral("AuditTray"),
              QStringLiteral("check_requested"),
              (nlohmann::json{{"trigger", TriggerEvent::UserClick}}));
    m_triggers->send(TriggerEvent::UserClick);
}

void AuditTray::applyStatus(const Status &status)
{
    const Presentation presentation = present(status);
    ALOG_INFO(QStringLiteral("AuditTray"),
              QStringLiteral("status_received"),
              (nlohmann::json{{"kind", toStatusKindString(status.kind)},
                              {"text", presentation.text},
                              {"icon", presentation.icon}}));

    if (m_checkAction) {
        m_checkAction->setText(QString::fromUtf8(kCheckForUpdates));
    }
    if (m_statusAction) {
        m_statusAction->setText(QString::fromStdString(presentation.text));

        clearUpdateMenu();
        if (hasUpdateList(status)) {
            m_updateMenu = std::make_unique<QMenu>();
            for (const Update &update : status.updates) {
                QAction *entry =
                    m_updateMenu->addAction(QString::fromStdString(update.text));
                const QUrl link(QString::fromStdString(update.link));
                connect(entry, &QAction::triggered, this, [link]() {
                    if (!QDesktopServices::openUrl(link)) {
                        ALOG_WARN(QStringLiteral("AuditTray"),
                                  QStringLiteral("open_link_failed"),
                                  (nlohmann::json{{"link", link.toString().toStdString()}}));
                    }
                });
            }
            m_statusAction->setMenu(m_updateMenu.get());
        }
    }

    m_trayIcon.setToolTip(QStringLiteral("Auditray - ")
                          + QString::fromStdString(presentation.text));
    setIcon(presentation.icon);
}

void AuditTray::clearUpdateMenu()
{
    if (m_statusAction) {
        m_statusAction->setMenu(static_cast<QMenu *>(nullptr));
    }
    m_updateMenu.reset();
}

void AuditTray::setIcon(Icon which)
{
    m_currentIcon = which;
    m_trayIcon.setIcon(m_icons.icon(which));
}

QString AuditTray::checkActionText() const
{
    return m_checkAction ? m_checkAction->text() : QString();
}

QString AuditTray::statusText() const
{
    return m_statusAction ? m_statusAction->text() : QString();
}

QStringList AuditTray::updateEntries() const
{
    QStringList entries;
    if (!m_updateMenu) {
        return entries;
    }
    for (const QAction *action : m_updateMenu->actions()) {
        entries << action->text();
    }
    return entries;
}

} // namespace auditray

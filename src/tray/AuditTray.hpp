#pragma once

#include <memory>

#include <QMenu>
#include <QObject>
#include <QSystemTrayIcon>

#include "common/models.hpp"
#include "core/trigger_channel.hpp"
#include "tray/IconLocator.hpp"

class QAction;

namespace auditray {

// AuditTray renders the latest status as a tray icon and context menu and
// turns "Check for updates" clicks into triggers. All of its state is touched
// on the GUI thread only; statuses arrive through applyStatus().
class AuditTray : public QObject
{
    Q_OBJECT
public:
    // triggers may be null for a display-only tray (icon preview).
    AuditTray(IconLocator icons, TriggerChannel *triggers, Icon initialIcon,
              QObject *parent = nullptr);
    ~AuditTray() override;

    QString checkActionText() const;
    QString statusText() const;
    QStringList updateEntries() const;
    Icon currentIcon() const { return m_currentIcon; }

public slots:
    void applyStatus(const auditray::Status &status);
    void requestCheck();

private:
    void setupMenu();
    void setIcon(Icon which);
    void clearUpdateMenu();

    IconLocator m_icons;
    TriggerChannel *m_triggers = nullptr;
    QSystemTrayIcon m_trayIcon;
    QMenu m_menu;
    std::unique_ptr<QMenu> m_updateMenu;
    QAction *m_checkAction = nullptr;
    QAction *m_statusAction = nullptr;
    QAction *m_quitAction = nullptr;
    Icon m_currentIcon = Icon::Check;
};

} // namespace auditray

#pragma once

#include <QFileSystemWatcher>
#include <QObject>
#include <QString>

#include "core/trigger_channel.hpp"

namespace auditray {

// Sends FileChanged whenever the watched path (normally the pacman local
// database directory) changes. Duplicate notifications are expected; the
// coordinator collapses them.
class PackageDbWatcher : public QObject
{
    Q_OBJECT
public:
    PackageDbWatcher(const QString &path, TriggerChannel &triggers,
                     QObject *parent = nullptr);
    ~PackageDbWatcher() override;

    // Starts watching. Returns false when the path cannot be watched, which
    // the caller treats as fatal.
    bool start();

    int notificationCount() const { return m_notifications; }
    bool isWatching() const;

private slots:
    void onPathChanged(const QString &changedPath);

private:
    QString m_path;
    TriggerChannel &m_triggers;
    QFileSystemWatcher m_watcher;
    int m_notifications = 0;
};

} // namespace auditray

#include "core/package_db_watcher.hpp"

#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace auditray {

PackageDbWatcher::PackageDbWatcher(const QString &path, TriggerChannel &triggers,
                                   QObject *parent)
    : QObject(parent)
    , m_path(path)
    , m_triggers(triggers)
{
    connect(&m_watcher, &QFileSystemWatcher::directoryChanged,
            this, &PackageDbWatcher::onPathChanged);
    connect(&m_watcher, &QFileSystemWatcher::fileChanged,
            this, &PackageDbWatcher::onPathChanged);
}

PackageDbWatcher::~PackageDbWatcher() = default;

bool PackageDbWatcher::start()
{
    if (!QFileInfo::exists(m_path)) {
        ALOG_ERROR(QStringLiteral("PackageDbWatcher"),
                   QStringLiteral("watch_path_missing"),
                   (nlohmann::json{{"path", m_path.toStdString()}}));
        return false;
    }

    if (!m_watcher.addPath(m_path)) {
        ALOG_ERROR(QStringLiteral("PackageDbWatcher"),
                   QStringLiteral("watch_failed"),
                   (nlohmann::json{{"path", m_path.toStdString()}}));
        return false;
    }

    ALOG_INFO(QStringLiteral("PackageDbWatcher"),
              QStringLiteral("watch_started"),
              (nlohmann::json{{"path", m_path.toStdString()}}));
    return true;
}

bool PackageDbWatcher::isWatching() const
{
    return m_watcher.files().contains(m_path)
        || m_watcher.directories().contains(m_path);
}

void PackageDbWatcher::onPathChanged(const QString &changedPath)
{
    ++m_notifications;
    ALOG_DEBUG(QStringLiteral("PackageDbWatcher"),
               QStringLiteral("path_changed"),
               (nlohmann::json{{"path", changedPath.toStdString()},
                               {"notifications", m_notifications}}));

    // A path that is replaced or removed drops out of the watch list.
    if (!isWatching()
        && !(QFileInfo::exists(m_path) && m_watcher.addPath(m_path))) {
        ALOG_WARN(QStringLiteral("PackageDbWatcher"),
                  QStringLiteral("watch_lost"),
                  (nlohmann::json{{"path", m_path.toStdString()},
                                  {"exists", QFileInfo::exists(m_path)}}));
    }

    m_triggers.send(TriggerEvent::FileChanged);
}

} // namespace auditray

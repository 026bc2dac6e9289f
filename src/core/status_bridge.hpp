#pragma once

#include <cstddef>
#include <deque>

#include <QMetaMethod>
#include <QObject>

#include "common/models.hpp"

namespace auditray {

/**
 * Hands statuses from the coordinator thread to the Qt main loop.
 *
 * publish() may be called from any thread and never waits for the main loop.
 * statusReady is emitted on the bridge's own thread, in publish order. If
 * nothing is connected to statusReady yet, statuses are held back and
 * delivered once a receiver connects.
 */
class StatusBridge : public QObject
{
    Q_OBJECT
public:
    explicit StatusBridge(QObject *parent = nullptr);
    ~StatusBridge() override;

    void publish(Status status);

    std::size_t backlogSize() const { return m_backlog.size(); }

signals:
    void statusReady(const auditray::Status &status);

protected:
    void connectNotify(const QMetaMethod &signal) override;

private:
    void deliver(const Status &status);
    void flushBacklog();
    bool hasReceiver() const;

    // Touched only on the bridge's thread.
    std::deque<Status> m_backlog;
};

} // namespace auditray

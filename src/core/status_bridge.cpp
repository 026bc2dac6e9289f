#include "core/status_bridge.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace auditray {

StatusBridge::StatusBridge(QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<auditray::Status>("auditray::Status");
}

StatusBridge::~StatusBridge() = default;

void StatusBridge::publish(Status status)
{
    // Posted events are delivered in FIFO order and survive until the
    // receiving event loop starts.
    QMetaObject::invokeMethod(
        this,
        [this, status = std::move(status)]() { deliver(status); },
        Qt::QueuedConnection);
}

void StatusBridge::connectNotify(const QMetaMethod &signal)
{
    if (signal == QMetaMethod::fromSignal(&StatusBridge::statusReady)) {
        QMetaObject::invokeMethod(this, [this]() { flushBacklog(); },
                                  Qt::QueuedConnection);
    }
}

bool StatusBridge::hasReceiver() const
{
    return isSignalConnected(QMetaMethod::fromSignal(&StatusBridge::statusReady));
}

void StatusBridge::deliver(const Status &status)
{
    if (!hasReceiver() || !m_backlog.empty()) {
        m_backlog.push_back(status);
        ALOG_DEBUG(QStringLiteral("StatusBridge"),
                   QStringLiteral("status_buffered"),
                   (nlohmann::json{{"kind", toStatusKindString(status.kind)},
                                   {"backlog", m_backlog.size()}}));
        flushBacklog();
        return;
    }
    emit statusReady(status);
}

void StatusBridge::flushBacklog()
{
    while (hasReceiver() && !m_backlog.empty()) {
        const Status next = std::move(m_backlog.front());
        m_backlog.pop_front();
        emit statusReady(next);
    }
}

} // namespace auditray

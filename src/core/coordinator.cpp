#include "core/coordinator.hpp"

#include <exception>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/status_model.hpp"

namespace auditray {

Coordinator::Coordinator(TriggerChannel &triggers, AdvisoryChecker &checker,
                         StatusBridge &bridge)
    : m_triggers(triggers)
    , m_checker(checker)
    , m_bridge(bridge)
{
}

Coordinator::~Coordinator()
{
    stop();
}

void Coordinator::start()
{
    if (m_thread) {
        return;
    }

    m_thread.reset(QThread::create([this]() { runLoop(); }));
    m_thread->setObjectName(QStringLiteral("auditray-coordinator"));
    m_thread->start();

    ALOG_INFO(QStringLiteral("Coordinator"),
              QStringLiteral("coordinator_started"),
              nlohmann::json::object());
}

void Coordinator::stop()
{
    if (!m_thread) {
        return;
    }

    m_triggers.close();
    m_thread->wait();
    m_thread.reset();

    ALOG_INFO(QStringLiteral("Coordinator"),
              QStringLiteral("coordinator_stopped"),
              (nlohmann::json{{"completedChecks", m_completedChecks.load()}}));
}

bool Coordinator::isRunning() const
{
    return m_thread && m_thread->isRunning();
}

void Coordinator::runLoop()
{
    try {
        while (const auto trigger = m_triggers.receive()) {
            // Collapse the burst: everything already queued is satisfied by
            // the check we are about to run.
            const std::size_t collapsed = m_triggers.drain();
            m_state = State::Running;

            const QString corrId =
                QStringLiteral("check-%1").arg(m_completedChecks.load() + 1);
            logging::CorrelationScope scope(corrId);
            ALOG_INFO(QStringLiteral("Coordinator"),
                      QStringLiteral("check_start"),
                      (nlohmann::json{{"trigger", *trigger},
                                      {"collapsed", collapsed}}));

            Status status = runCheck();

            ALOG_INFO(QStringLiteral("Coordinator"),
                      QStringLiteral("check_finished"),
                      (nlohmann::json{{"kind", toStatusKindString(status.kind)},
                                      {"updates", status.updates.size()}}));

            m_completedChecks.fetch_add(1);
            m_state = State::Idle;
            m_bridge.publish(std::move(status));
        }
    } catch (const std::exception &ex) {
        // Without this thread no further check can ever run.
        ALOG_ERROR(QStringLiteral("Coordinator"),
                   QStringLiteral("coordinator_died"),
                   (nlohmann::json{{"error", ex.what()}}));
        qFatal("auditray: coordinator thread failed: %s", ex.what());
    }
}

Status Coordinator::runCheck()
{
    CheckOutcome outcome;
    try {
        outcome = CheckOutcome::success(m_checker.check());
    } catch (const std::exception &ex) {
        ALOG_WARN(QStringLiteral("Coordinator"),
                  QStringLiteral("check_failed"),
                  (nlohmann::json{{"error", ex.what()}}));
        outcome = CheckOutcome::failure(ex.what());
    }
    return classify(outcome);
}

} // namespace auditray

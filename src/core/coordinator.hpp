#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include <QThread>

#include "common/models.hpp"
#include "core/advisory_checker.hpp"
#include "core/status_bridge.hpp"
#include "core/trigger_channel.hpp"

namespace auditray {

/**
 * Coordinator owns the background thread that turns triggers into checks.
 *
 * - Waits on the trigger channel while Idle.
 * - On a trigger, discards everything else already queued, then runs exactly
 *   one check, so a burst of triggers costs one checker invocation.
 * - Triggers that arrive while a check runs stay queued and cause exactly one
 *   follow-up check.
 * - Every completed check publishes one Status to the bridge. Checker
 *   failures become Status::Error and never end the thread.
 *
 * An in-flight check cannot be interrupted; stop() waits for it.
 */
class Coordinator
{
public:
    enum class State {
        Idle,
        Running
    };

    Coordinator(TriggerChannel &triggers, AdvisoryChecker &checker,
                StatusBridge &bridge);
    ~Coordinator();

    Coordinator(const Coordinator &) = delete;
    Coordinator &operator=(const Coordinator &) = delete;

    void start();

    // Closes the trigger channel and joins the thread.
    void stop();

    bool isRunning() const;
    State state() const { return m_state.load(); }
    std::uint64_t completedChecks() const { return m_completedChecks.load(); }

private:
    void runLoop();
    Status runCheck();

    TriggerChannel &m_triggers;
    AdvisoryChecker &m_checker;
    StatusBridge &m_bridge;

    std::unique_ptr<QThread> m_thread;
    std::atomic<State> m_state{State::Idle};
    std::atomic<std::uint64_t> m_completedChecks{0};
};

} // namespace auditray

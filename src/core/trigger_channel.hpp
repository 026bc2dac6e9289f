#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "common/enums.hpp"

namespace auditray {

/**
 * Unbounded multi-producer, single-consumer queue of trigger events.
 *
 * send() never waits for the consumer. receive() blocks until an event is
 * queued or the channel is closed. Events are never dropped here; collapsing
 * bursts is the coordinator's job.
 */
class TriggerChannel
{
public:
    TriggerChannel() = default;

    TriggerChannel(const TriggerChannel &) = delete;
    TriggerChannel &operator=(const TriggerChannel &) = delete;

    // Ignored once the channel is closed.
    void send(TriggerEvent event);

    // Blocks. Returns std::nullopt once the channel has been closed.
    std::optional<TriggerEvent> receive();

    // Non-blocking variant of receive().
    std::optional<TriggerEvent> tryReceive();

    // Removes every queued event without blocking; returns how many.
    std::size_t drain();

    void close();
    bool isClosed() const;
    std::size_t pending() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_ready;
    std::deque<TriggerEvent> m_queue;
    bool m_closed = false;
};

} // namespace auditray

#include "core/trigger_channel.hpp"

namespace auditray {

void TriggerChannel::send(TriggerEvent event)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return;
        }
        m_queue.push_back(event);
    }
    m_ready.notify_one();
}

std::optional<TriggerEvent> TriggerChannel::receive()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_ready.wait(lock, [this]() { return m_closed || !m_queue.empty(); });
    if (m_closed) {
        return std::nullopt;
    }
    const TriggerEvent event = m_queue.front();
    m_queue.pop_front();
    return event;
}

std::optional<TriggerEvent> TriggerChannel::tryReceive()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed || m_queue.empty()) {
        return std::nullopt;
    }
    const TriggerEvent event = m_queue.front();
    m_queue.pop_front();
    return event;
}

std::size_t TriggerChannel::drain()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::size_t count = m_queue.size();
    m_queue.clear();
    return count;
}

void TriggerChannel::close()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        m_queue.clear();
    }
    m_ready.notify_all();
}

bool TriggerChannel::isClosed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

std::size_t TriggerChannel::pending() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

} // namespace auditray

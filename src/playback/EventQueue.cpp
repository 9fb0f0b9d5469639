#include "EventQueue.h"

namespace playback {

BackendEventQueue::BackendEventQueue(std::function<void()> wake) : m_wake(std::move(wake)) {}

BackendEventQueue::~BackendEventQueue() {}

void BackendEventQueue::post(media::BackendEvent event)
{
    bool wasEmpty = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        wasEmpty = m_queue.empty();
        m_queue.push(std::move(event));
    }
    if (wasEmpty && m_wake) {
        m_wake();
    }
}

std::queue<media::BackendEvent> BackendEventQueue::takeAll()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::queue<media::BackendEvent> events;
    events.swap(m_queue);
    return events;
}

void BackendEventQueue::clearBefore(int serial)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::queue<media::BackendEvent> kept;
    while (!m_queue.empty()) {
        if (m_queue.front().serial >= serial) {
            kept.push(std::move(m_queue.front()));
        }
        m_queue.pop();
    }
    m_queue.swap(kept);
}

size_t BackendEventQueue::size()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

} // namespace playback

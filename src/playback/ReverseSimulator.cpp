#include "ReverseSimulator.h"
#include <logger.h>

namespace playback {
ReverseSimulator::ReverseSimulator(TaskScheduler& scheduler, std::function<void()> stepBackward)
    : m_scheduler(scheduler), m_stepBackward(std::move(stepBackward))
{
}
ReverseSimulator::~ReverseSimulator()
{
    m_task.cancel();
}
void ReverseSimulator::trigger()
{
    if (m_active) {
        if (m_multiplier >= MAX_MULTIPLIER) {
            return;
        }
        ++m_multiplier;
    } else {
        m_active = true;
        m_multiplier = 1;
    }
    NEAPU_LOGD("Reverse simulation at {}x, interval {:.4f}s", m_multiplier, interval());
    restartTimer();
}
void ReverseSimulator::stop()
{
    m_task.cancel();
    if (m_active) {
        NEAPU_LOGD("Reverse simulation stopped");
    }
    m_active = false;
    m_multiplier = 1;
}
double ReverseSimulator::displayedSpeed() const
{
    return m_active ? -static_cast<double>(m_multiplier) : 1.0;
}
double ReverseSimulator::interval() const
{
    return BASE_INTERVAL / m_multiplier;
}
void ReverseSimulator::restartTimer()
{
    m_task = m_scheduler.scheduleRepeating(interval(), [this]() {
        if (m_stepBackward) {
            m_stepBackward();
        }
    });
}
} // namespace playback

#include "Scheduler.h"
#include <QObject>
#include <QPointer>
#include <QTimer>
#include <algorithm>
#include <chrono>
#include <cmath>

namespace playback {
ScheduledTask::ScheduledTask(std::shared_ptr<State> state) : m_state(std::move(state)) {}

ScheduledTask::~ScheduledTask()
{
    cancel();
}
ScheduledTask::ScheduledTask(ScheduledTask&& other) noexcept : m_state(std::move(other.m_state)) {}

ScheduledTask& ScheduledTask::operator=(ScheduledTask&& other) noexcept
{
    if (this != &other) {
        cancel();
        m_state = std::move(other.m_state);
    }
    return *this;
}
void ScheduledTask::cancel()
{
    if (!m_state) {
        return;
    }
    auto state = std::move(m_state);
    if (state->active) {
        state->active = false;
        auto onCancel = std::move(state->onCancel);
        if (onCancel) {
            onCancel();
        }
    }
}
bool ScheduledTask::isActive() const
{
    return m_state && m_state->active;
}

QtTaskScheduler::QtTaskScheduler(QObject* context) : m_context(context) {}

ScheduledTask QtTaskScheduler::scheduleRepeating(double intervalSeconds, std::function<void()> task)
{
    return schedule(intervalSeconds, false, std::move(task));
}
ScheduledTask QtTaskScheduler::scheduleOnce(double delaySeconds, std::function<void()> task)
{
    return schedule(delaySeconds, true, std::move(task));
}
ScheduledTask QtTaskScheduler::schedule(double seconds, bool singleShot, std::function<void()> task)
{
    auto state = std::make_shared<ScheduledTask::State>();
    auto* timer = new QTimer(m_context);
    timer->setTimerType(Qt::PreciseTimer);
    timer->setSingleShot(singleShot);
    timer->setInterval(std::chrono::milliseconds(std::max<long long>(1, std::llround(seconds * 1000.0))));

    QPointer<QTimer> guard(timer);
    std::weak_ptr<ScheduledTask::State> weakState = state;
    QObject::connect(timer, &QTimer::timeout, timer, [weakState, singleShot, guard, task = std::move(task)]() {
        auto current = weakState.lock();
        if (!current || !current->active) {
            return;
        }
        if (singleShot) {
            current->active = false;
            current->onCancel = nullptr;
            if (guard) {
                guard->deleteLater();
            }
        }
        task();
    });
    state->onCancel = [guard]() {
        if (guard) {
            guard->stop();
            guard->deleteLater();
        }
    };
    timer->start();
    return ScheduledTask(std::move(state));
}
} // namespace playback

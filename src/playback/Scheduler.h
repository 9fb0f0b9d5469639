#pragma once
#include <functional>
#include <memory>

class QObject;

namespace playback {

// 定时任务句柄，析构或 cancel() 时取消，cancel 可重复调用
class ScheduledTask {
public:
    struct State {
        bool active{true};
        std::function<void()> onCancel;
    };

    ScheduledTask() = default;
    explicit ScheduledTask(std::shared_ptr<State> state);
    ~ScheduledTask();
    ScheduledTask(const ScheduledTask&) = delete;
    ScheduledTask& operator=(const ScheduledTask&) = delete;
    ScheduledTask(ScheduledTask&& other) noexcept;
    ScheduledTask& operator=(ScheduledTask&& other) noexcept;

    void cancel();
    bool isActive() const;

private:
    std::shared_ptr<State> m_state;
};

class TaskScheduler {
public:
    virtual ~TaskScheduler() = default;

    virtual ScheduledTask scheduleRepeating(double intervalSeconds, std::function<void()> task) = 0;
    virtual ScheduledTask scheduleOnce(double delaySeconds, std::function<void()> task) = 0;
};

// 基于 QTimer，回调在 context 所在线程执行
class QtTaskScheduler final : public TaskScheduler {
public:
    explicit QtTaskScheduler(QObject* context);

    ScheduledTask scheduleRepeating(double intervalSeconds, std::function<void()> task) override;
    ScheduledTask scheduleOnce(double delaySeconds, std::function<void()> task) override;

private:
    ScheduledTask schedule(double seconds, bool singleShot, std::function<void()> task);

    QObject* m_context{nullptr};
};

} // namespace playback

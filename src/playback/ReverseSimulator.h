#pragma once
#include <functional>
#include "Scheduler.h"

namespace playback {

// 两个引擎都不支持负速率，用逐帧回退模拟倒放
class ReverseSimulator {
public:
    static constexpr double BASE_INTERVAL = 1.0 / 24.0;
    static constexpr int MAX_MULTIPLIER = 4;

    ReverseSimulator(TaskScheduler& scheduler, std::function<void()> stepBackward);
    ~ReverseSimulator();
    ReverseSimulator(const ReverseSimulator&) = delete;
    ReverseSimulator& operator=(const ReverseSimulator&) = delete;

    // 未激活时启动，已激活时加速
    void trigger();
    void stop();

    bool isActive() const { return m_active; }
    int multiplier() const { return m_multiplier; }
    double displayedSpeed() const;
    double interval() const;

private:
    void restartTimer();

    TaskScheduler& m_scheduler;
    std::function<void()> m_stepBackward;
    ScheduledTask m_task;
    bool m_active{false};
    int m_multiplier{1};
};

} // namespace playback

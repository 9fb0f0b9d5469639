#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <vector>
#include "playback/Scheduler.h"

namespace tests {

// 虚拟时钟调度器，只有 advance() 时才执行任务
class ManualScheduler final : public playback::TaskScheduler {
public:
    playback::ScheduledTask scheduleRepeating(double intervalSeconds, std::function<void()> task) override
    {
        return add(intervalSeconds, true, std::move(task));
    }
    playback::ScheduledTask scheduleOnce(double delaySeconds, std::function<void()> task) override
    {
        return add(delaySeconds, false, std::move(task));
    }

    void advance(double seconds)
    {
        const int64_t target = m_nowUs + toMicros(seconds);
        while (true) {
            purge();
            std::shared_ptr<Entry> next;
            for (const auto& entry : m_entries) {
                if (entry->due <= target && (!next || entry->due < next->due)) {
                    next = entry;
                }
            }
            if (!next) {
                break;
            }
            m_nowUs = next->due;
            auto state = next->state.lock();
            if (!state || !state->active) {
                continue;
            }
            if (next->repeating) {
                next->due += next->interval;
            } else {
                state->active = false;
                next->state.reset();
            }
            auto task = next->task;
            task();
        }
        m_nowUs = target;
    }

    size_t activeCount()
    {
        purge();
        return m_entries.size();
    }
    double now() const { return static_cast<double>(m_nowUs) / 1e6; }

private:
    struct Entry {
        std::weak_ptr<playback::ScheduledTask::State> state;
        int64_t due{0};
        int64_t interval{0};
        bool repeating{false};
        std::function<void()> task;
    };

    static int64_t toMicros(double seconds) { return std::max<int64_t>(1, std::llround(seconds * 1e6)); }

    playback::ScheduledTask add(double seconds, bool repeating, std::function<void()> task)
    {
        auto state = std::make_shared<playback::ScheduledTask::State>();
        auto entry = std::make_shared<Entry>();
        entry->state = state;
        entry->interval = toMicros(seconds);
        entry->due = m_nowUs + entry->interval;
        entry->repeating = repeating;
        entry->task = std::move(task);
        m_entries.push_back(entry);
        return playback::ScheduledTask(std::move(state));
    }

    void purge()
    {
        std::erase_if(m_entries, [](const std::shared_ptr<Entry>& entry) {
            auto state = entry->state.lock();
            return !state || !state->active;
        });
    }

    int64_t m_nowUs{0};
    std::vector<std::shared_ptr<Entry>> m_entries;
};

} // namespace tests

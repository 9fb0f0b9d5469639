#pragma once
#include <functional>
#include <mutex>
#include <queue>
#include "media/BackendAdapter.h"

namespace playback {

// 引擎线程 -> 协调线程的事件队列
class BackendEventQueue final : public media::BackendEventSink {
public:
    // 队列由空变为非空时调用，可能在任意线程
    explicit BackendEventQueue(std::function<void()> wake);
    ~BackendEventQueue() override;
    BackendEventQueue(const BackendEventQueue&) = delete;
    BackendEventQueue& operator=(const BackendEventQueue&) = delete;

    void post(media::BackendEvent event) override;

    std::queue<media::BackendEvent> takeAll();
    void clearBefore(int serial);
    size_t size();

private:
    std::queue<media::BackendEvent> m_queue;
    std::mutex m_mutex;
    std::function<void()> m_wake;
};

} // namespace playback

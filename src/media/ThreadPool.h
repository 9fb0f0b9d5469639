#ifndef THREADPOOL_H
#define THREADPOOL_H

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace media {
// 探测任务的工作线程，析构时先执行完队列中的任务
class ThreadPool {
public:
    using Task = std::function<void()>;

    explicit ThreadPool(size_t threads)
    {
        if (threads == 0) {
            threads = std::max(1u, std::thread::hardware_concurrency());
        }
        m_workers.reserve(threads);
        for (size_t i = 0; i < threads; ++i) {
            m_workers.emplace_back([this] { workerLoop(); });
        }
    }
    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stop = true;
        }
        m_condition.notify_all();
        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // 停止后提交的任务直接丢弃
    bool post(Task task)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stop) {
                return false;
            }
            m_tasks.push(std::move(task));
        }
        m_condition.notify_one();
        return true;
    }

    size_t threadCount() const { return m_workers.size(); }
    size_t pendingCount() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_tasks.size();
    }

private:
    void workerLoop()
    {
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_condition.wait(lock, [this] { return m_stop || !m_tasks.empty(); });
                if (m_stop && m_tasks.empty()) {
                    return;
                }
                task = std::move(m_tasks.front());
                m_tasks.pop();
            }
            task();
        }
    }

    std::vector<std::thread> m_workers;
    std::queue<Task> m_tasks;
    std::condition_variable m_condition;
    mutable std::mutex m_mutex;
    bool m_stop{false};
};
} // namespace media

#endif // THREADPOOL_H

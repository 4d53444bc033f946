#include "castbridge/utils/threading.hpp"

#include <algorithm>

namespace castbridge {
namespace utils {

ThreadPool::ThreadPool(size_t num_threads) : m_size(std::max<size_t>(num_threads, 1)) {
    m_workers.reserve(m_size);
    for (size_t i = 0; i < m_size; ++i) {
        m_workers.emplace_back([this](std::stop_token stop_token) { worker_thread(stop_token); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(m_queue_mutex);
        m_shutdown = true;
    }
    for (auto& worker : m_workers) {
        worker.request_stop();
    }
    m_condition.notify_all();
    m_workers.clear();

    std::queue<std::function<void()>> abandoned;
    {
        std::lock_guard lock(m_queue_mutex);
        abandoned.swap(m_tasks);
    }
}

void ThreadPool::worker_thread(std::stop_token stop_token) {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(m_queue_mutex);
            if (!m_condition.wait(lock, stop_token, [this] { return !m_tasks.empty() || m_shutdown; })) {
                return;
            }
            if (m_shutdown) {
                return;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop();
        }
        // packaged_task keeps the callable's exceptions in its future
        task();
    }
}

} // namespace utils
} // namespace castbridge

#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace castbridge {
namespace utils {

// Fixed-size worker pool running the discovery providers of a pass side by side
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // nullopt once the pool is shut down; exceptions from f surface through the future
    template<typename F>
    auto try_submit(F&& f) -> std::optional<std::future<std::invoke_result_t<F>>>;

    // Joins the workers; queued tasks that never started report broken_promise
    void shutdown();

    [[nodiscard]] size_t size() const { return m_size; }

private:
    std::vector<std::jthread> m_workers;
    std::queue<std::function<void()>> m_tasks;
    std::mutex m_queue_mutex;
    std::condition_variable_any m_condition;
    bool m_shutdown = false;
    size_t m_size = 0;

    void worker_thread(std::stop_token stop_token);
};

template<typename F>
auto ThreadPool::try_submit(F&& f) -> std::optional<std::future<std::invoke_result_t<F>>> {
    using return_type = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    auto result = task->get_future();
    {
        std::lock_guard lock(m_queue_mutex);
        if (m_shutdown) {
            return std::nullopt;
        }
        m_tasks.emplace([task]() { (*task)(); });
    }
    m_condition.notify_one();
    return result;
}

} // namespace utils
} // namespace castbridge

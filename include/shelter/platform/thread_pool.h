#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace shelter::platform {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Submit a task and get a future for the result
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    // Submit a fire-and-forget task
    void post(std::function<void()> task);

    // Block until the queue is empty and no task is running. Tasks posted
    // by running tasks are waited for as well.
    void wait_idle();

    // Queued plus running tasks
    size_t in_flight() const;

    size_t size() const;

    // Shutdown the pool (waits for pending tasks to complete)
    void shutdown();

    bool is_running() const;

private:
    void enqueue(std::function<void()> task);
    void worker_loop();

    std::vector<std::jthread> workers_;
    std::deque<std::function<void()>> tasks_;
    size_t active_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::atomic<bool> shutdown_{false};
};

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using ReturnType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );
    auto future = task->get_future();
    enqueue([task]() { (*task)(); });
    return future;
}

} // namespace shelter::platform

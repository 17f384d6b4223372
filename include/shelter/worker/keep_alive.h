#pragma once
#include <shelter/platform/thread_pool.h>

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace shelter::worker {

// Tracks work that outlives the event that started it (background cache
// writes). The host calls wait_idle() before it suspends or exits.
class KeepAlive {
public:
    using ErrorSink = std::function<void(const std::string& label, const std::string& message,
                                         std::uint64_t correlation_id)>;

    KeepAlive(platform::ThreadPool& pool, ErrorSink on_error);
    ~KeepAlive();

    KeepAlive(const KeepAlive&) = delete;
    KeepAlive& operator=(const KeepAlive&) = delete;

    // Run `work` detached. Anything it throws is reported to the error sink
    // under `label` and goes no further.
    void extend(const std::string& label, std::function<void()> work,
                std::uint64_t correlation_id = 0);

    void wait_idle();
    size_t outstanding() const;

private:
    void run(const std::string& label, const std::function<void()>& work,
             std::uint64_t correlation_id);
    void report(const std::string& label, const std::string& message,
                std::uint64_t correlation_id);
    void finish_one();

    platform::ThreadPool& pool_;
    ErrorSink on_error_;
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    size_t outstanding_ = 0;
};

} // namespace shelter::worker

#include <shelter/worker/keep_alive.h>

#include <exception>
#include <memory>
#include <stdexcept>

namespace shelter::worker {

KeepAlive::KeepAlive(platform::ThreadPool& pool, ErrorSink on_error)
    : pool_(pool), on_error_(std::move(on_error)) {}

KeepAlive::~KeepAlive() {
    wait_idle();
}

void KeepAlive::extend(const std::string& label, std::function<void()> work,
                       std::uint64_t correlation_id) {
    {
        std::lock_guard lock(mutex_);
        ++outstanding_;
    }

    auto shared_work = std::make_shared<std::function<void()>>(std::move(work));
    try {
        pool_.post([this, label, shared_work, correlation_id]() {
            run(label, *shared_work, correlation_id);
        });
    } catch (const std::runtime_error&) {
        // Pool already shut down: finish the work on the caller's thread
        run(label, *shared_work, correlation_id);
    }
}

void KeepAlive::run(const std::string& label, const std::function<void()>& work,
                    std::uint64_t correlation_id) {
    // Released on every path, or wait_idle() would never return
    struct Done {
        KeepAlive& self;
        ~Done() { self.finish_one(); }
    } done{*this};

    try {
        work();
    } catch (const std::exception& e) {
        report(label, e.what(), correlation_id);
    } catch (...) {
        report(label, "unknown exception", correlation_id);
    }
}

void KeepAlive::report(const std::string& label, const std::string& message,
                       std::uint64_t correlation_id) {
    if (on_error_) {
        on_error_(label, message, correlation_id);
    }
}

void KeepAlive::finish_one() {
    std::lock_guard lock(mutex_);
    if (--outstanding_ == 0) {
        idle_cv_.notify_all();
    }
}

void KeepAlive::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this]() { return outstanding_ == 0; });
}

size_t KeepAlive::outstanding() const {
    std::lock_guard lock(mutex_);
    return outstanding_;
}

} // namespace shelter::worker

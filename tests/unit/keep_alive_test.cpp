#include <shelter/worker/keep_alive.h>
#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace shelter::worker;
using shelter::platform::ThreadPool;

namespace {

class KeepAliveTest : public ::testing::Test {
protected:
    KeepAlive::ErrorSink sink() {
        return [this](const std::string& label, const std::string& message, std::uint64_t) {
            std::lock_guard lock(mutex);
            errors.push_back(label + ": " + message);
        };
    }

    ThreadPool pool{2};
    std::mutex mutex;
    std::vector<std::string> errors;
};

} // namespace

TEST_F(KeepAliveTest, WaitIdleCoversDetachedWork) {
    KeepAlive keep_alive(pool, sink());
    std::atomic<int> count{0};
    for (int i = 0; i < 10; ++i) {
        keep_alive.extend("count", [&count] { ++count; });
    }
    keep_alive.wait_idle();
    EXPECT_EQ(count.load(), 10);
    EXPECT_EQ(keep_alive.outstanding(), 0u);
    EXPECT_TRUE(errors.empty());
}

TEST_F(KeepAliveTest, ExceptionsGoToTheSink) {
    KeepAlive keep_alive(pool, sink());
    keep_alive.extend("cache-put /a", [] { throw std::runtime_error("quota exceeded"); });
    keep_alive.wait_idle();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "cache-put /a: quota exceeded");
}

TEST_F(KeepAliveTest, NonStandardExceptionIsReportedAndReleased) {
    KeepAlive keep_alive(pool, sink());
    keep_alive.extend("odd", [] { throw 7; });
    keep_alive.wait_idle();
    EXPECT_EQ(keep_alive.outstanding(), 0u);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "odd: unknown exception");
}

TEST_F(KeepAliveTest, RunsInlineAfterPoolShutdown) {
    KeepAlive keep_alive(pool, sink());
    pool.shutdown();
    bool ran = false;
    keep_alive.extend("late", [&ran] { ran = true; });
    EXPECT_TRUE(ran);
    EXPECT_EQ(keep_alive.outstanding(), 0u);
}

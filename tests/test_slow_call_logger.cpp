// =============================================================================
// FILE: tests/test_slow_call_logger.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "common/slow_call_logger.h"
#include <thread>

using namespace device_watch;

TEST(SlowCallLogger, NoLogBelowThreshold) {
    Config c;
    c.slow_call_warn_threshold = Millisecs(1000);  // 1s, won't trigger
    SlowCallLogger logger(c);

    {
        SlowCallLogger::Timer timer(logger, "SUBSCRIBE", "devA");
    }

    EXPECT_EQ(logger.stats().calls_timed.load(), 1u);
    EXPECT_EQ(logger.stats().warn_count.load(), 0u);
}

TEST(SlowCallLogger, LogsAboveWarnThreshold) {
    Config c;
    c.slow_call_warn_threshold = Millisecs(1);
    c.slow_call_error_threshold = Millisecs(10000);
    c.slow_call_critical_threshold = Millisecs(100000);
    SlowCallLogger logger(c);

    {
        SlowCallLogger::Timer timer(logger, "RENEW", "devA", "id=sub-1");
        std::this_thread::sleep_for(Millisecs(5));
    }

    EXPECT_GE(logger.stats().warn_count.load(), 1u);
    EXPECT_GE(logger.stats().max_duration_ms.load(), 5u);
}

TEST(SlowCallLogger, CriticalAboveCriticalThreshold) {
    Config c;
    SlowCallLogger logger(c);
    logger.set_thresholds(Millisecs(0), Millisecs(1), Millisecs(2));

    SlowCallLogger::Timer timer(logger, "UNSUBSCRIBE", "devA");
    std::this_thread::sleep_for(Millisecs(5));
    timer.finish();

    EXPECT_EQ(logger.stats().critical_count.load(), 1u);
    EXPECT_EQ(logger.stats().error_count.load(), 0u);
}

TEST(SlowCallLogger, FinishCountsOnce) {
    Config c;
    SlowCallLogger logger(c);
    {
        SlowCallLogger::Timer timer(logger, "SUBSCRIBE", "devA");
        timer.finish();
        timer.finish();
    }
    EXPECT_EQ(logger.stats().calls_timed.load(), 1u);
}

TEST(SlowCallLogger, UpdateThresholdsAtRuntime) {
    Config c;
    SlowCallLogger logger(c);

    logger.set_thresholds(Millisecs(10), Millisecs(100), Millisecs(500));

    auto th = logger.thresholds();
    EXPECT_EQ(th.warn.count(), 10);
    EXPECT_EQ(th.error.count(), 100);
    EXPECT_EQ(th.critical.count(), 500);
}

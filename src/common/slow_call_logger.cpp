// =============================================================================
// FILE: src/common/slow_call_logger.cpp
// =============================================================================
#include "common/slow_call_logger.h"

namespace device_watch {

SlowCallLogger::SlowCallLogger(const Config& config)
    : warn_ms_(config.slow_call_warn_threshold.count())
    , error_ms_(config.slow_call_error_threshold.count())
    , critical_ms_(config.slow_call_critical_threshold.count())
{}

void SlowCallLogger::set_thresholds(Millisecs warn, Millisecs error, Millisecs critical) {
    warn_ms_.store(warn.count(), std::memory_order_relaxed);
    error_ms_.store(error.count(), std::memory_order_relaxed);
    critical_ms_.store(critical.count(), std::memory_order_relaxed);
}

SlowCallLogger::Thresholds SlowCallLogger::thresholds() const {
    return {
        Millisecs(warn_ms_.load(std::memory_order_relaxed)),
        Millisecs(error_ms_.load(std::memory_order_relaxed)),
        Millisecs(critical_ms_.load(std::memory_order_relaxed))
    };
}

void SlowCallLogger::check_and_log(const char* operation, const std::string& device_id,
                                   const std::string& extra_context, Millisecs elapsed) {
    int64_t ms = elapsed.count();
    stats_.calls_timed.fetch_add(1, std::memory_order_relaxed);

    uint64_t prev_max = stats_.max_duration_ms.load(std::memory_order_relaxed);
    while (ms > 0 && static_cast<uint64_t>(ms) > prev_max) {
        if (stats_.max_duration_ms.compare_exchange_weak(prev_max, static_cast<uint64_t>(ms),
                std::memory_order_relaxed)) break;
    }

    int64_t crit = critical_ms_.load(std::memory_order_relaxed);
    int64_t err  = error_ms_.load(std::memory_order_relaxed);
    int64_t warn = warn_ms_.load(std::memory_order_relaxed);

    if (ms >= crit) {
        stats_.critical_count.fetch_add(1, std::memory_order_relaxed);
        LOG_SLOW_CALL(LogLevel::kError, "SLOW_CALL CRITICAL: %s took %ldms device=%s %s",
                      operation, static_cast<long>(ms), device_id.c_str(), extra_context.c_str());
    } else if (ms >= err) {
        stats_.error_count.fetch_add(1, std::memory_order_relaxed);
        LOG_SLOW_CALL(LogLevel::kError, "SLOW_CALL: %s took %ldms device=%s %s",
                      operation, static_cast<long>(ms), device_id.c_str(), extra_context.c_str());
    } else if (ms >= warn) {
        stats_.warn_count.fetch_add(1, std::memory_order_relaxed);
        LOG_SLOW_CALL(LogLevel::kWarn, "SLOW_CALL: %s took %ldms device=%s %s",
                      operation, static_cast<long>(ms), device_id.c_str(), extra_context.c_str());
    }
}

SlowCallLogger::Timer::Timer(SlowCallLogger& logger, const char* operation,
                             const std::string& device_id, const std::string& extra)
    : logger_(logger), operation_(operation), device_id_(device_id)
    , extra_context_(extra), start_(Clock::now())
{}

SlowCallLogger::Timer::~Timer() {
    finish();
}

void SlowCallLogger::Timer::finish() {
    if (finished_.exchange(true)) return;
    logger_.check_and_log(operation_, device_id_, extra_context_, elapsed());
}

} // namespace device_watch

// =============================================================================
// FILE: include/common/slow_call_logger.h
// =============================================================================
#ifndef SLOW_CALL_LOGGER_H
#define SLOW_CALL_LOGGER_H

#include "common/types.h"
#include "common/config.h"
#include "common/logger.h"
#include <atomic>
#include <string>

namespace device_watch {

// Times transport round-trips and reports the slow ones.
// Usage:
//   auto timer = std::make_shared<SlowCallLogger::Timer>(slow_logger, "RENEW", device_id);
//   transport.subscribe(..., [timer](...) { timer->finish(); ... });
//
// Level by elapsed time:
//   >= warn_threshold:     WARN
//   >= error_threshold:    ERROR
//   >= critical_threshold: ERROR, counted as critical
// Every slow call also lands in the dedicated slow-call log.
class SlowCallLogger {
public:
    explicit SlowCallLogger(const Config& config);

    void set_thresholds(Millisecs warn, Millisecs error, Millisecs critical);

    struct Thresholds {
        Millisecs warn;
        Millisecs error;
        Millisecs critical;
    };
    Thresholds thresholds() const;

    class Timer {
    public:
        Timer(SlowCallLogger& logger, const char* operation,
              const std::string& device_id, const std::string& extra_context = "");
        ~Timer();

        // Explicit finish; later calls and the destructor are no-ops
        void finish();

        Millisecs elapsed() const {
            return std::chrono::duration_cast<Millisecs>(Clock::now() - start_);
        }

        Timer(const Timer&) = delete;
        Timer& operator=(const Timer&) = delete;

    private:
        SlowCallLogger& logger_;
        const char* operation_;
        std::string device_id_;
        std::string extra_context_;
        TimePoint start_;
        std::atomic<bool> finished_{false};
    };

    struct Stats {
        std::atomic<uint64_t> calls_timed{0};
        std::atomic<uint64_t> warn_count{0};
        std::atomic<uint64_t> error_count{0};
        std::atomic<uint64_t> critical_count{0};
        std::atomic<uint64_t> max_duration_ms{0};
    };
    const Stats& stats() const { return stats_; }

    SlowCallLogger(const SlowCallLogger&) = delete;
    SlowCallLogger& operator=(const SlowCallLogger&) = delete;

private:
    friend class Timer;
    void check_and_log(const char* operation, const std::string& device_id,
                       const std::string& extra_context, Millisecs elapsed);

    std::atomic<int64_t> warn_ms_;
    std::atomic<int64_t> error_ms_;
    std::atomic<int64_t> critical_ms_;
    Stats stats_;
};

} // namespace device_watch
#endif // SLOW_CALL_LOGGER_H

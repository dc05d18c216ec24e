// =============================================================================
// FILE: include/common/types.h
// =============================================================================
#ifndef COMMON_TYPES_H
#define COMMON_TYPES_H

#include <cstdint>
#include <chrono>
#include <string>
#include <vector>

namespace device_watch {

using Clock          = std::chrono::steady_clock;
using TimePoint      = Clock::time_point;
using Duration       = Clock::duration;
using Millisecs      = std::chrono::milliseconds;
using Seconds        = std::chrono::seconds;
using SubscriptionKey = uint64_t;
using DeviceId       = std::string;
using NameList       = std::vector<std::string>;

enum class Result {
    kOk, kError, kTimeout, kNotFound, kAlreadyExists,
    kInvalidArgument, kSubscriptionFailed, kShuttingDown,
    kConnectionLost, kParseError
};

inline const char* result_to_string(Result r) {
    switch (r) {
        case Result::kOk:                 return "OK";
        case Result::kError:              return "Error";
        case Result::kTimeout:            return "Timeout";
        case Result::kNotFound:           return "NotFound";
        case Result::kAlreadyExists:      return "AlreadyExists";
        case Result::kInvalidArgument:    return "InvalidArgument";
        case Result::kSubscriptionFailed: return "SubscriptionFailed";
        case Result::kShuttingDown:       return "ShuttingDown";
        case Result::kConnectionLost:     return "ConnectionLost";
        case Result::kParseError:         return "ParseError";
        default:                          return "Unknown";
    }
}

// Joins watched names for log lines: "prop.power,event.doneWashing"
inline std::string join_names(const NameList& names, char sep = ',') {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += sep;
        out += names[i];
    }
    return out;
}

// Scoped timer for measuring operation durations
class ScopedTimer {
public:
    ScopedTimer() : start_(Clock::now()) {}
    Millisecs elapsed_ms() const {
        return std::chrono::duration_cast<Millisecs>(Clock::now() - start_);
    }
    double elapsed_sec() const {
        return std::chrono::duration<double>(Clock::now() - start_).count();
    }
private:
    TimePoint start_;
};

} // namespace device_watch
#endif // COMMON_TYPES_H

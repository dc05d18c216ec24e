// =============================================================================
// FILE: src/common/logger.cpp
// =============================================================================
#include "common/logger.h"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <sys/stat.h>
#include <unistd.h>

namespace device_watch {

// =============================================================================
// LogSink
// =============================================================================

LogSink::LogSink(const LogSinkConfig& config) : config_(config) {
    if (!config_.file_path.empty()) {
        open_file();
    }
}

LogSink::~LogSink() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fp_ && fp_ != stderr && fp_ != stdout) {
        fflush(fp_);
        fclose(fp_);
        fp_ = nullptr;
    }
}

void LogSink::open_file() {
    if (config_.file_path.empty()) return;

    fp_ = fopen(config_.file_path.c_str(), "a");
    if (!fp_) {
        fprintf(stderr, "LOGGER: failed to open log file '%s': %s\n",
                config_.file_path.c_str(), strerror(errno));
        fp_ = stderr;
        return;
    }

    struct stat st;
    if (fstat(fileno(fp_), &st) == 0) {
        current_size_ = static_cast<size_t>(st.st_size);
    }
}

std::string LogSink::rotated_path(int index) const {
    return config_.file_path + "." + std::to_string(index);
}

bool LogSink::needs_rotation() const {
    return config_.max_file_size_bytes > 0 &&
           current_size_ >= config_.max_file_size_bytes;
}

void LogSink::rotate() {
    if (!fp_ || fp_ == stderr || fp_ == stdout) return;

    fflush(fp_);
    fclose(fp_);
    fp_ = nullptr;

    // Oldest falls off, every other index shifts up by one, current becomes .1
    if (config_.max_rotated_files > 0) {
        std::remove(rotated_path(config_.max_rotated_files).c_str());
        for (int i = config_.max_rotated_files - 1; i >= 1; --i) {
            std::rename(rotated_path(i).c_str(), rotated_path(i + 1).c_str());
        }
        std::rename(config_.file_path.c_str(), rotated_path(1).c_str());
    } else {
        std::remove(config_.file_path.c_str());
    }

    current_size_ = 0;
    open_file();
}

void LogSink::write(LogLevel level, const char* formatted_msg, size_t len) {
    if (level < config_.min_level || level > config_.max_level) return;

    std::lock_guard<std::mutex> lk(mu_);
    if (!fp_) return;

    if (needs_rotation()) {
        rotate();
        if (!fp_) return;
    }

    size_t written = fwrite(formatted_msg, 1, len, fp_);
    current_size_ += written;

    if (config_.also_stderr && fp_ != stderr) {
        fwrite(formatted_msg, 1, len, stderr);
    }

    if (level >= LogLevel::kWarn) {
        fflush(fp_);
    }
}

void LogSink::flush() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fp_) fflush(fp_);
}

// =============================================================================
// Logger
// =============================================================================

Logger::Logger() : level_(LogLevel::kInfo) {}

Logger::~Logger() {
    flush_all();
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::configure(const std::string& log_dir,
                       const std::string& base_name,
                       LogLevel console_level,
                       size_t max_file_size_bytes,
                       int max_rotated_files) {
    std::lock_guard<std::mutex> lk(configure_mu_);

    sinks_.clear();
    slow_call_sink_.reset();

    if (!log_dir.empty() && mkdir(log_dir.c_str(), 0755) != 0 && errno != EEXIST) {
        fprintf(stderr, "LOGGER: cannot create '%s': %s\n", log_dir.c_str(), strerror(errno));
    }

    const std::string prefix = log_dir.empty() ? base_name : log_dir + "/" + base_name;

    struct FileSpec {
        const char* suffix;
        LogLevel    min_level;
        int         rotated;
        bool        also_stderr;
    };
    const FileSpec specs[] = {
        {".log",       LogLevel::kInfo,  max_rotated_files,     console_level <= LogLevel::kInfo},
        {"_debug.log", LogLevel::kTrace, max_rotated_files / 2, false},
        {"_error.log", LogLevel::kError, max_rotated_files,     true},
    };

    for (const auto& spec : specs) {
        LogSinkConfig cfg;
        cfg.file_path           = prefix + spec.suffix;
        cfg.max_file_size_bytes = max_file_size_bytes;
        cfg.max_rotated_files   = spec.rotated;
        cfg.min_level           = spec.min_level;
        cfg.also_stderr         = spec.also_stderr;
        sinks_.push_back(std::make_unique<LogSink>(cfg));
    }

    LogSinkConfig slow;
    slow.file_path           = prefix + "_slow.log";
    slow.max_file_size_bytes = max_file_size_bytes;
    slow.max_rotated_files   = max_rotated_files;
    slow_call_sink_ = std::make_unique<LogSink>(slow);

    configured_.store(true, std::memory_order_release);

    fprintf(stderr, "Logger configured: dir=%s base=%s max_size=%zu max_files=%d\n",
            log_dir.c_str(), base_name.c_str(), max_file_size_bytes, max_rotated_files);
}

void Logger::reset_to_stderr() {
    std::lock_guard<std::mutex> lk(configure_mu_);
    configured_.store(false, std::memory_order_release);
    sinks_.clear();
    slow_call_sink_.reset();
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lk(configure_mu_);
    sinks_.push_back(std::move(sink));
}

size_t Logger::format_message(char* buf, size_t buf_size,
                              LogLevel level, const char* file, int line,
                              const char* fmt, va_list args) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    auto tid = static_cast<unsigned long>(pthread_self());

    const char* base = strrchr(file, '/');
    base = base ? base + 1 : file;

    int prefix_len = snprintf(buf, buf_size,
        "%04d-%02d-%02d %02d:%02d:%02d.%03d [%s] [tid:%lu] [%s:%d] ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<int>(ms.count()),
        log_level_name(level), tid, base, line);

    if (prefix_len < 0 || static_cast<size_t>(prefix_len) >= buf_size) {
        return 0;
    }

    int msg_len = vsnprintf(buf + prefix_len,
                            buf_size - static_cast<size_t>(prefix_len),
                            fmt, args);

    if (msg_len < 0) return static_cast<size_t>(prefix_len);

    size_t total = static_cast<size_t>(prefix_len) + static_cast<size_t>(msg_len);
    if (total >= buf_size - 1) total = buf_size - 2;

    buf[total] = '\n';
    buf[total + 1] = '\0';
    return total + 1;
}

void Logger::dispatch(LogLevel level, const char* buf, size_t len) {
    if (!configured_.load(std::memory_order_acquire)) {
        fwrite(buf, 1, len, stderr);
        if (level >= LogLevel::kWarn) fflush(stderr);
        return;
    }

    std::lock_guard<std::mutex> lk(configure_mu_);
    for (auto& sink : sinks_) {
        sink->write(level, buf, len);
    }
}

void Logger::log(LogLevel level, const char* file, int line, const char* fmt, ...) {
    if (level < level_.load(std::memory_order_relaxed)) return;

    char buf[4096];
    va_list args;
    va_start(args, fmt);
    size_t len = format_message(buf, sizeof(buf), level, file, line, fmt, args);
    va_end(args);

    if (len == 0) return;
    dispatch(level, buf, len);

    if (level == LogLevel::kFatal) {
        flush_all();
    }
}

void Logger::log_slow_call(LogLevel level, const char* file, int line, const char* fmt, ...) {
    char buf[4096];
    va_list args;
    va_start(args, fmt);
    size_t len = format_message(buf, sizeof(buf), level, file, line, fmt, args);
    va_end(args);

    if (len == 0) return;

    if (configured_.load(std::memory_order_acquire)) {
        std::lock_guard<std::mutex> lk(configure_mu_);
        if (slow_call_sink_) slow_call_sink_->write(level, buf, len);
    }
    dispatch(level, buf, len);
}

void Logger::flush_all() {
    std::lock_guard<std::mutex> lk(configure_mu_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
    if (slow_call_sink_) slow_call_sink_->flush();
    fflush(stderr);
}

} // namespace device_watch

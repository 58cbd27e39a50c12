#include "logging/Log.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace {
using logging::Log;

constexpr std::size_t kMessageBufferSize = 2048;
constexpr std::size_t kQueueCapacity = 4096;

struct LogRecord {
    config::LogLevel level{};
    logging::LogCategory category{};
    std::chrono::system_clock::time_point timestamp{};
    std::string text;
};

// stdout carries the CSV, so every record goes to stderr and, when set, to a file.
class Sinks {
public:
    ~Sinks() { closeFile_(); }

    void write(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::fprintf(stderr, "%s\n", line.c_str());
        std::fflush(stderr);
        if (file_ != nullptr) {
            std::fprintf(file_, "%s\n", line.c_str());
            std::fflush(file_);
        }
    }

    void setFile(const std::string& path) {
        std::FILE* next = nullptr;
        if (!path.empty()) {
            next = std::fopen(path.c_str(), "a");
            if (next == nullptr) {
                throw std::runtime_error("Cannot open log file " + path);
            }
        }
        std::lock_guard<std::mutex> lock(mutex_);
        closeFile_();
        file_ = next;
    }

private:
    void closeFile_() {
        if (file_ != nullptr) {
            std::fclose(file_);
            file_ = nullptr;
        }
    }

    std::mutex mutex_;
    std::FILE* file_ = nullptr;
};

Sinks& sinks() {
    static Sinks instance;
    return instance;
}

std::string formatLine(const LogRecord& record) {
    using namespace std::chrono;
    const auto sinceEpoch = duration_cast<milliseconds>(record.timestamp.time_since_epoch()).count();
    const std::time_t seconds = static_cast<std::time_t>(sinceEpoch / 1000);

    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    char prefix[64];
    std::snprintf(prefix, sizeof(prefix), "%04d-%02d-%02d %02d:%02d:%02d.%03d %-5s %-5s ", utc.tm_year + 1900,
                  utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec,
                  static_cast<int>(sinceEpoch % 1000), Log::level_to_string(record.level),
                  Log::category_to_string(record.category));
    return prefix + record.text;
}

// Formatting and I/O happen on one worker so protocol loops never block on stderr.
class Dispatcher {
public:
    bool push(LogRecord&& record) {
        std::call_once(started_, [this] {
            // Constructed first so the sinks outlive the worker at exit.
            (void)sinks();
            worker_ = std::thread([this] { drain_(); });
            std::atexit([] { Dispatcher::dispatcher().stop(); });
        });
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ || queue_.size() >= kQueueCapacity) {
                return false;
            }
            queue_.push_back(std::move(record));
        }
        wake_.notify_one();
        return true;
    }

    void waitIdle() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this] { return stopping_ || (queue_.empty() && !busy_); });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        wake_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    static Dispatcher& dispatcher() {
        static Dispatcher instance;
        return instance;
    }

private:
    void drain_() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;
            }
            LogRecord record = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
            lock.unlock();

            sinks().write(formatLine(record));

            lock.lock();
            busy_ = false;
            if (queue_.empty()) {
                idle_.notify_all();
            }
        }
        idle_.notify_all();
    }

    std::once_flag started_;
    std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    std::deque<LogRecord> queue_;
    bool busy_ = false;
    bool stopping_ = false;
    std::thread worker_;
};

}  // namespace

namespace logging {

std::atomic<config::LogLevel> Log::currentLevel{config::LogLevel::Info};

void Log::set_log_level(config::LogLevel level) {
    currentLevel.store(level, std::memory_order_relaxed);
}

config::LogLevel Log::get_log_level() {
    return currentLevel.load(std::memory_order_relaxed);
}

void Log::set_log_file(const std::string& path) {
    flush();
    sinks().setFile(path);
}

bool Log::try_parse_log_level(std::string_view value, config::LogLevel& levelOut) {
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    static const std::array<std::pair<const char*, config::LogLevel>, 6> kNames{{
        {"trace", config::LogLevel::Trace},
        {"debug", config::LogLevel::Debug},
        {"info", config::LogLevel::Info},
        {"warn", config::LogLevel::Warn},
        {"warning", config::LogLevel::Warn},
        {"error", config::LogLevel::Error},
    }};
    for (const auto& [name, level] : kNames) {
        if (normalized == name) {
            levelOut = level;
            return true;
        }
    }
    return false;
}

const char* Log::level_to_string(config::LogLevel level) {
    switch (level) {
    case config::LogLevel::Error:
        return "ERROR";
    case config::LogLevel::Warn:
        return "WARN";
    case config::LogLevel::Info:
        return "INFO";
    case config::LogLevel::Debug:
        return "DEBUG";
    case config::LogLevel::Trace:
        return "TRACE";
    }
    return "UNKNOWN";
}

const char* Log::category_to_string(LogCategory category) {
    switch (category) {
    case LogCategory::NET:
        return "NET";
    case LogCategory::PROTO:
        return "PROTO";
    case LogCategory::DATA:
        return "DATA";
    case LogCategory::AUTH:
        return "AUTH";
    case LogCategory::SCHED:
        return "SCHED";
    case LogCategory::CACHE:
        return "CACHE";
    case LogCategory::APP:
        return "APP";
    }
    return "UNKNOWN";
}

void Log::flush() {
    Dispatcher::dispatcher().waitIdle();
}

void Log::log(config::LogLevel level, LogCategory category, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    vlog(level, category, fmt, args);
    va_end(args);
}

void Log::vlog(config::LogLevel level, LogCategory category, const char* fmt, std::va_list args) {
    if (config::logLevelSeverity(level) < config::logLevelSeverity(get_log_level())) {
        return;
    }

    std::array<char, kMessageBufferSize> buffer{};
    const int written = std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    if (written < 0) {
        std::snprintf(buffer.data(), buffer.size(), "<format-error>");
    } else if (static_cast<std::size_t>(written) >= buffer.size()) {
        std::snprintf(buffer.data() + buffer.size() - 4, 4, "...");
    }

    LogRecord record;
    record.level = level;
    record.category = category;
    record.timestamp = std::chrono::system_clock::now();
    record.text.assign(buffer.data());

    if (!Dispatcher::dispatcher().push(LogRecord(record))) {
        // Saturated or shutting down: warnings and errors are still written inline.
        if (level == config::LogLevel::Error || level == config::LogLevel::Warn) {
            sinks().write(formatLine(record));
        }
    }
}

}  // namespace logging

// SEEDFORGE - Logging
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License
//
// Process-wide diagnostic log. Records go to a single replaceable sink;
// there is none until a program calls Initialize() or SetSink(), so the
// library stays silent when embedded. Mnemonics, passphrases, seeds and
// keys are never logged.

#ifndef SEEDFORGE_UTIL_LOGGING_H
#define SEEDFORGE_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace seedforge {
namespace util {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; accepts "warning" for Warn. nullopt if unknown.
std::optional<LogLevel> LogLevelFromString(const std::string& str);

/// Subsystem tags attached to each record
namespace LogCategory {
    constexpr const char* MNEMONIC = "mnemonic";
    constexpr const char* DERIVE = "derive";
    constexpr const char* ADDRESS = "address";
    constexpr const char* CONFIG = "config";
}

struct LogRecord {
    LogLevel level{LogLevel::Info};
    const char* category{""};
    std::string message;
    const char* file{""};
    int line{0};
    std::chrono::system_clock::time_point time;
};

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
    virtual void Flush() {}
};

/// "HH:MM:SS.mmm LEVEL [category] message" on stderr
class StderrSink : public LogSink {
public:
    void Write(const LogRecord& record) override;
    void Flush() override;

    static std::string Format(const LogRecord& record);
};

/// Hands every record to a function; used to capture output
class FunctionSink : public LogSink {
public:
    using Function = std::function<void(const LogRecord&)>;

    explicit FunctionSink(Function fn) : fn_(std::move(fn)) {}
    void Write(const LogRecord& record) override { fn_(record); }

private:
    Function fn_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Install a StderrSink unless a sink is already set
    void Initialize();

    /// Flush and remove the sink
    void Shutdown();

    /// Replace the sink and return the previous one (may be null)
    std::shared_ptr<LogSink> SetSink(std::shared_ptr<LogSink> sink);
    bool HasSink() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// True when a record at level would reach a sink
    bool Enabled(LogLevel level) const;

    void Write(LogLevel level, const char* category, std::string message,
               const char* file = "", int line = 0);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    std::shared_ptr<LogSink> sink_;
    std::atomic<LogLevel> level_{LogLevel::Warn};
};

/**
 * Keeps the logger initialized for its lifetime and shuts it down on
 * every exit path, exceptions included.
 */
class LoggingSession {
public:
    explicit LoggingSession(LogLevel level);
    ~LoggingSession();

    LoggingSession(const LoggingSession&) = delete;
    LoggingSession& operator=(const LoggingSession&) = delete;
};

// ============================================================================
// Macros
// ============================================================================

/// Collects one record with operator<< and writes it when destroyed
class LogLine {
public:
    LogLine(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template<typename T>
    LogLine& operator<<(const T& value) {
        out_ << value;
        return *this;
    }

private:
    std::ostringstream out_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

#define SEEDFORGE_LOG(level, category) \
    if (!::seedforge::util::Logger::Instance().Enabled(::seedforge::util::LogLevel::level)) {} \
    else ::seedforge::util::LogLine(::seedforge::util::LogLevel::level, category, __FILE__, __LINE__)

#define LOG_TRACE(category) SEEDFORGE_LOG(Trace, category)
#define LOG_DEBUG(category) SEEDFORGE_LOG(Debug, category)
#define LOG_INFO(category)  SEEDFORGE_LOG(Info, category)
#define LOG_WARN(category)  SEEDFORGE_LOG(Warn, category)
#define LOG_ERROR(category) SEEDFORGE_LOG(Error, category)

/// Logs how long the enclosing scope took, at Debug level
class LogTimer {
public:
    LogTimer(const char* category, std::string what);
    ~LogTimer();

    LogTimer(const LogTimer&) = delete;
    LogTimer& operator=(const LogTimer&) = delete;

private:
    const char* category_;
    std::string what_;
    std::chrono::steady_clock::time_point start_;
};

#define SEEDFORGE_LOG_TIMER_CAT(a, b) a##b
#define SEEDFORGE_LOG_TIMER_NAME(line) SEEDFORGE_LOG_TIMER_CAT(seedforge_log_timer_, line)
#define SEEDFORGE_LOG_TIMER(category, what) \
    ::seedforge::util::LogTimer SEEDFORGE_LOG_TIMER_NAME(__LINE__)(category, what)

} // namespace util
} // namespace seedforge

#endif // SEEDFORGE_UTIL_LOGGING_H

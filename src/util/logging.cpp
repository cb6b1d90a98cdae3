// SEEDFORGE - Logging Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include "seedforge/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

namespace seedforge {
namespace util {

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "?";
}

std::optional<LogLevel> LogLevelFromString(const std::string& str) {
    std::string name(str);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (LogLevel level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                           LogLevel::Warn, LogLevel::Error, LogLevel::Off}) {
        if (name == LogLevelToString(level)) {
            return level;
        }
    }
    if (name == "warning") {
        return LogLevel::Warn;
    }
    return std::nullopt;
}

// ============================================================================
// StderrSink
// ============================================================================

std::string StderrSink::Format(const LogRecord& record) {
    auto since = record.time.time_since_epoch();
    std::time_t secs = std::chrono::system_clock::to_time_t(record.time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since).count() % 1000;

    std::tm parts{};
    localtime_r(&secs, &parts);

    std::string level = LogLevelToString(record.level);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::ostringstream out;
    out << std::put_time(&parts, "%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << ' '
        << std::setfill(' ') << std::left << std::setw(5) << level << ' ';
    if (record.category[0] != '\0') {
        out << '[' << record.category << "] ";
    }
    out << record.message;
    return out.str();
}

void StderrSink::Write(const LogRecord& record) {
    std::string text = Format(record);
    std::fprintf(stderr, "%s\n", text.c_str());
}

void StderrSink::Flush() {
    std::fflush(stderr);
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::Initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sink_) {
        sink_ = std::make_shared<StderrSink>();
    }
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_->Flush();
        sink_.reset();
    }
}

std::shared_ptr<LogSink> Logger::SetSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_.swap(sink);
    return sink;
}

bool Logger::HasSink() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sink_ != nullptr;
}

bool Logger::Enabled(LogLevel level) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    return HasSink();
}

void Logger::Write(LogLevel level, const char* category, std::string message,
                   const char* file, int line) {
    if (!Enabled(level)) {
        return;
    }

    LogRecord record;
    record.level = level;
    record.category = category;
    record.message = std::move(message);
    record.file = file;
    record.line = line;
    record.time = std::chrono::system_clock::now();

    // Serializes sink output across threads
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_->Write(record);
    }
}

LoggingSession::LoggingSession(LogLevel level) {
    Logger::Instance().SetLevel(level);
    Logger::Instance().Initialize();
}

LoggingSession::~LoggingSession() {
    Logger::Instance().Shutdown();
}

// ============================================================================
// LogLine / LogTimer
// ============================================================================

LogLine::~LogLine() {
    Logger::Instance().Write(level_, category_, out_.str(), file_, line_);
}

LogTimer::LogTimer(const char* category, std::string what)
    : category_(category)
    , what_(std::move(what))
    , start_(std::chrono::steady_clock::now()) {}

LogTimer::~LogTimer() {
    Logger& logger = Logger::Instance();
    if (!logger.Enabled(LogLevel::Debug)) {
        return;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_);

    std::ostringstream out;
    out << what_ << " took " << elapsed.count() << "us";
    logger.Write(LogLevel::Debug, category_, out.str());
}

} // namespace util
} // namespace seedforge

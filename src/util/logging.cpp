// STARDUST - Logging Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

namespace stardust {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
        default:              return "UNKNOWN";
    }
}

bool ParseLogLevel(const std::string& str, LogLevel& level) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") { level = LogLevel::Trace; return true; }
    if (upper == "DEBUG") { level = LogLevel::Debug; return true; }
    if (upper == "INFO")  { level = LogLevel::Info;  return true; }
    if (upper == "WARN" || upper == "WARNING") { level = LogLevel::Warn; return true; }
    if (upper == "ERROR") { level = LogLevel::Error; return true; }
    if (upper == "FATAL") { level = LogLevel::Fatal; return true; }
    if (upper == "OFF")   { level = LogLevel::Off;   return true; }
    return false;
}

LogLevel LogLevelFromString(const std::string& str) {
    LogLevel level = LogLevel::Info;
    ParseLogLevel(str, level);
    return level;
}

// ============================================================================
// Formatting
// ============================================================================

namespace {

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tmBuf;
    localtime_r(&time, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace

std::string FormatLogEntry(const LogEntry& entry, bool showTimestamp,
                           bool showCategory, bool showThread) {
    std::ostringstream oss;
    if (showTimestamp) {
        oss << FormatTimestamp(entry.timestamp) << " ";
    }
    oss << "[" << LogLevelToString(entry.level) << "] ";
    if (showCategory && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        oss << "[" << entry.category << "] ";
    }
    if (showThread) {
        oss << "[" << entry.threadId << "] ";
    }
    oss << entry.message;
    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink() = default;

ConsoleSink::ConsoleSink(const Config& config) : config_(config) {}

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }

    std::string formatted = FormatLogEntry(entry, config_.showTimestamp,
                                           config_.showCategory, config_.showThread);

    std::lock_guard<std::mutex> lock(mutex_);
    FILE* stream = stdout;
    if (config_.useStderr && entry.level >= LogLevel::Error) {
        stream = stderr;
    }
    fprintf(stream, "%s\n", formatted.c_str());
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    fflush(stdout);
    fflush(stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, LogLevel level)
    : file_(path, std::ios::out | std::ios::app), level_(level) {}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < level_) {
        return;
    }

    std::string formatted = FormatLogEntry(entry, true, true, true);

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << formatted << '\n';
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// CallbackSink
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : callback_(std::move(callback)), level_(level) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (entry.level < level_ || !callback_) {
        return;
    }
    callback_(entry);
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::Initialize() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    if (sinks_.empty()) {
        sinks_.push_back(std::make_shared<ConsoleSink>());
    }
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.insert(category);
    allCategoriesEnabled_ = false;
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.erase(category);
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    if (allCategoriesEnabled_) {
        return true;
    }
    return enabledCategories_.count(category) > 0;
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    allCategoriesEnabled_ = true;
    enabledCategories_.clear();
}

void Logger::Log(LogLevel level, const std::string& category,
                 const std::string& message, const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();
    entry.threadId = std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    return IsCategoryEnabled(category);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::LogStream(LogLevel level, const char* category, const char* file, int line)
    : level_(level), category_(category), file_(file), line_(line) {}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

} // namespace util
} // namespace stardust

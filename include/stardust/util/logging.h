// STARDUST - Logging System
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Leveled, categorized, thread-safe logging with pluggable sinks.
// Secret material (seeds, private keys, passphrases) must never be logged.

#ifndef STARDUST_UTIL_LOGGING_H
#define STARDUST_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace stardust {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

const char* LogLevelToString(LogLevel level);

/// Parse a level name (case-insensitive). Returns false for unknown names.
bool ParseLogLevel(const std::string& str, LogLevel& level);

/// Parse a level name, falling back to Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* WALLET = "wallet";
    constexpr const char* SIGNER = "signer";
    constexpr const char* TXBUILDER = "txbuilder";
    constexpr const char* CONFIRM = "confirm";
    constexpr const char* SYNC = "sync";
    constexpr const char* CODEC = "codec";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;

    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes formatted entries to stdout (errors optionally to stderr)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useStderr{false};
        bool showTimestamp{true};
        bool showCategory{true};
        bool showThread{false};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends formatted entries to a file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    std::ofstream file_;
    mutable std::mutex mutex_;
    LogLevel level_;
};

/// Forwards entries to a callback (used by tests to capture output)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    CallbackSink() = default;
    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
};

/// Format an entry as "timestamp [LEVEL] [category] message"
std::string FormatLogEntry(const LogEntry& entry, bool showTimestamp,
                           bool showCategory, bool showThread);

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Install a console sink if no sink is configured yet
    void Initialize();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    bool allCategoriesEnabled_{true};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and hands it to the logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define STARDUST_LOGGER ::stardust::util::Logger::Instance()

#define STARDUST_LOG_ENABLED(level, category) \
    STARDUST_LOGGER.WillLog(::stardust::util::LogLevel::level, category)

#define STARDUST_LOG(level, category) \
    if (!STARDUST_LOG_ENABLED(level, category)) {} else \
        ::stardust::util::LogStream(::stardust::util::LogLevel::level, category, \
                                    __FILE__, __LINE__)

#define LOG_TRACE(category)   STARDUST_LOG(Trace, category)
#define LOG_DEBUG(category)   STARDUST_LOG(Debug, category)
#define LOG_INFO(category)    STARDUST_LOG(Info, category)
#define LOG_WARN(category)    STARDUST_LOG(Warn, category)
#define LOG_ERROR(category)   STARDUST_LOG(Error, category)
#define LOG_FATAL(category)   STARDUST_LOG(Fatal, category)

} // namespace util
} // namespace stardust

#endif // STARDUST_UTIL_LOGGING_H

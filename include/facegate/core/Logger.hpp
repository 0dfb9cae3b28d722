#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace facegate {
namespace core {

class Configuration;

/**
 * Logger severity levels
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Parse a level name ("debug", "INFO", "warn", ...). Unknown names map to INFO.
 */
LogLevel parseLogLevel(const std::string& name);

/**
 * Upper-case level name as written in log lines
 */
const char* logLevelName(LogLevel level);

/**
 * @brief Logging sinks and threshold, read from the `logging.*` section
 */
struct LogSettings {
    LogLevel level = LogLevel::INFO;
    bool console = true;
    bool file = false;
    std::string directory = "/tmp/facegate_logs";

    static LogSettings fromConfiguration(const Configuration& config);
};

/**
 * @brief Process-wide thread-safe logger
 *
 * Lines are written as `[YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] message (file:line)`.
 * ERROR and CRITICAL go to stderr, everything else to stdout. File output is
 * append-mode and independent of the console switch.
 */
class Logger {
public:
    static Logger& getInstance();

    void setLevel(LogLevel level) { minLevel_.store(level); }
    LogLevel getLevel() const { return minLevel_.load(); }

    void setConsoleOutput(bool enable) { consoleOutput_.store(enable); }

    /**
     * Apply settings. When file output is requested a timestamped file is
     * opened under settings.directory.
     * @return false if the log file could not be opened (console logging still applies)
     */
    bool configure(const LogSettings& settings);

    /**
     * Create logDirectory (with parents) and open `log_facegate_<timestamp>.txt` in it
     * @return true if the file is open for writing
     */
    bool initializeWithTimestamp(const std::string& logDirectory,
                                 LogLevel level = LogLevel::INFO);

    /**
     * Path of the open log file, empty when file logging is off
     */
    std::string getCurrentLogFile() const;

    void closeLogFile();

    void flush();

    void log(LogLevel level, const std::string& message,
             const char* file = nullptr, int line = 0);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool openTimestampedFile(const std::string& directory);

    std::atomic<LogLevel> minLevel_{LogLevel::INFO};
    std::atomic<bool> consoleOutput_{true};

    mutable std::mutex mutex_;
    std::ofstream logFile_;
    std::string currentLogFile_;
};

#define FACEGATE_LOG_AT(level, msg) \
    facegate::core::Logger::getInstance().log(level, msg, __FILE__, __LINE__)

#define LOG_TRACE(msg) FACEGATE_LOG_AT(facegate::core::LogLevel::TRACE, msg)
#define LOG_DEBUG(msg) FACEGATE_LOG_AT(facegate::core::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) FACEGATE_LOG_AT(facegate::core::LogLevel::INFO, msg)
#define LOG_WARNING(msg) FACEGATE_LOG_AT(facegate::core::LogLevel::WARNING, msg)
#define LOG_ERROR(msg) FACEGATE_LOG_AT(facegate::core::LogLevel::ERROR, msg)
#define LOG_CRITICAL(msg) FACEGATE_LOG_AT(facegate::core::LogLevel::CRITICAL, msg)

/**
 * @brief Collects one line with operator<< and logs it on destruction,
 * prefixed with "[component] "
 */
class LogStream {
public:
    explicit LogStream(LogLevel level, const std::string& component = "")
        : level_(level), component_(component) {}

    ~LogStream() {
        if (level_ < Logger::getInstance().getLevel()) {
            return;
        }
        Logger::getInstance().log(level_, component_.empty()
            ? stream_.str()
            : "[" + component_ + "] " + stream_.str());
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::string component_;
    std::ostringstream stream_;
};

#define FACEGATE_LOG_DEBUG(component) \
    facegate::core::LogStream(facegate::core::LogLevel::DEBUG, component)
#define FACEGATE_LOG_INFO(component) \
    facegate::core::LogStream(facegate::core::LogLevel::INFO, component)
#define FACEGATE_LOG_WARNING(component) \
    facegate::core::LogStream(facegate::core::LogLevel::WARNING, component)
#define FACEGATE_LOG_ERROR(component) \
    facegate::core::LogStream(facegate::core::LogLevel::ERROR, component)
#define FACEGATE_LOG_CRITICAL(component) \
    facegate::core::LogStream(facegate::core::LogLevel::CRITICAL, component)

} // namespace core
} // namespace facegate

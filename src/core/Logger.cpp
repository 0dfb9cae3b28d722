#include "facegate/core/Logger.hpp"
#include "facegate/core/Configuration.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <system_error>

namespace facegate {
namespace core {

namespace fs = std::filesystem;

namespace {

std::tm localNow(std::chrono::system_clock::time_point now) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);
    return local_tm;
}

std::string lineTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    const std::tm local_tm = localNow(now);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

const char* baseName(const char* path) {
    const char* base = path;
    for (const char* p = path; *p != '\0'; ++p) {
        if (*p == '/' || *p == '\\') {
            base = p + 1;
        }
    }
    return base;
}

} // anonymous namespace

LogLevel parseLogLevel(const std::string& name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return "TRACE";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARNING";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

LogSettings LogSettings::fromConfiguration(const Configuration& config) {
    LogSettings settings;
    settings.level = parseLogLevel(config.getString("logging.level", logLevelName(settings.level)));
    settings.console = config.getBool("logging.console", settings.console);
    settings.file = config.getBool("logging.file", settings.file);
    settings.directory = config.getString("logging.directory", settings.directory);
    return settings;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    closeLogFile();
}

bool Logger::configure(const LogSettings& settings) {
    minLevel_.store(settings.level);
    consoleOutput_.store(settings.console);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!settings.file) {
        if (logFile_.is_open()) {
            logFile_.close();
        }
        currentLogFile_.clear();
        return true;
    }
    return openTimestampedFile(settings.directory);
}

bool Logger::initializeWithTimestamp(const std::string& logDirectory, LogLevel level) {
    minLevel_.store(level);

    std::lock_guard<std::mutex> lock(mutex_);
    return openTimestampedFile(logDirectory);
}

bool Logger::openTimestampedFile(const std::string& directory) {
    if (logFile_.is_open()) {
        logFile_.close();
    }
    currentLogFile_.clear();

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec || !fs::is_directory(directory)) {
        std::cerr << "[Logger] Could not create log directory " << directory
                  << (ec ? ": " + ec.message() : std::string()) << std::endl;
        return false;
    }

    const std::tm local_tm = localNow(std::chrono::system_clock::now());
    std::ostringstream name;
    name << "log_facegate_" << std::put_time(&local_tm, "%Y-%m-%d_%H-%M-%S") << ".txt";
    const std::string path = (fs::path(directory) / name.str()).string();

    logFile_.open(path, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[Logger] Failed to open log file " << path << std::endl;
        return false;
    }
    currentLogFile_ = path;

    logFile_ << "=== facegate log started " << lineTimestamp()
             << " (level " << logLevelName(minLevel_.load()) << ") ===" << std::endl;
    return true;
}

std::string Logger::getCurrentLogFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentLogFile_;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    currentLogFile_.clear();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    std::cerr.flush();
    if (logFile_.is_open()) {
        logFile_.flush();
    }
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line) {
    if (level < minLevel_.load()) {
        return;
    }

    std::ostringstream oss;
    oss << "[" << lineTimestamp() << "] [" << logLevelName(level) << "] " << message;
    if (file != nullptr && *file != '\0' && line > 0) {
        oss << " (" << baseName(file) << ":" << line << ")";
    }
    const std::string formatted = oss.str();

    std::lock_guard<std::mutex> lock(mutex_);
    if (consoleOutput_.load()) {
        std::ostream& out = level >= LogLevel::ERROR ? std::cerr : std::cout;
        out << formatted << std::endl;
    }
    if (logFile_.is_open()) {
        logFile_ << formatted << std::endl;
    }
}

} // namespace core
} // namespace facegate

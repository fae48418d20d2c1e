#include "celestiada/sdk/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <mutex>

namespace celestiada {
namespace sdk {

// Initialize static variables
std::mutex Logger::instance_mutex_;
Logger* Logger::instance_ = nullptr;

Logger& Logger::instance() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) {
        instance_ = new Logger();
    }
    return *instance_;
}

bool Logger::is_initialized() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.log_mutex_);
    return logger.initialized_;
}

Logger::Logger()
    : log_path_(constants::LOG_PATH),
      min_level_(LogLevel::INFO),
      initialized_(false) {
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::initialize(const std::string& log_path, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (initialized_) {
        log_internal(LogLevel::INFO, "Logger already initialized, reinitializing with new parameters");
    }

    log_path_ = log_path;
    min_level_ = min_level;

    std::error_code ec;
    std::filesystem::create_directories(log_path_, ec);

    open_log_file();

    initialized_ = true;
    log_internal(LogLevel::INFO, "Logger initialized");
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_internal(level, message);
}

void Logger::trace(const std::string& message) {
    log(LogLevel::TRACE, message);
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::critical(const std::string& message) {
    log(LogLevel::CRITICAL, message);
}

Logger::LogLevel Logger::get_log_level() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return min_level_;
}

void Logger::set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    min_level_ = level;
}

bool Logger::is_level_enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return level >= min_level_;
}

std::string Logger::get_log_path() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return log_path_;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_file_.is_open()) {
        log_file_.flush();
    }
    std::cerr.flush();
}

void Logger::log_internal(LogLevel level, const std::string& message) {
    if (level < min_level_) {
        return;
    }

    const std::string line = "[" + get_current_timestamp() + "] [" + level_to_string(level) + "] " + message;

    // Not initialized yet, or no usable log file: stderr only
    if (!initialized_ || !log_file_.is_open()) {
        std::cerr << line << std::endl;
        return;
    }

    check_and_rotate_log();

    log_file_ << line << std::endl;

    // Also output to stderr for error and critical messages
    if (level >= LogLevel::ERROR) {
        std::cerr << line << std::endl;
    }
}

void Logger::open_log_file() {
    if (log_file_.is_open()) {
        log_file_.close();
    }

    std::string filename = log_path_ + "/celestia_da_" +
                           get_current_timestamp("%Y%m%d_%H%M%S") + ".log";
    log_file_.open(filename, std::ios::out | std::ios::app);

    if (!log_file_.is_open()) {
        // Fallback in the current directory
        log_file_.open("celestia_da.log", std::ios::out | std::ios::app);
    }
}

void Logger::check_and_rotate_log() {
    if (log_file_.tellp() >= static_cast<std::streamoff>(max_log_file_size_)) {
        open_log_file();
    }
}

Logger::LogLevel Logger::level_from_string(const std::string& name) {
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning" || name == "warn") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "critical") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

std::string Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string Logger::get_current_timestamp(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    char buffer[128];
    strftime(buffer, sizeof(buffer), format, &tm_now);

    return std::string(buffer);
}

} // namespace sdk
} // namespace celestiada

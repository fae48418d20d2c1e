/**
 * @file Logger.hpp
 * @brief Process-wide logging facility with levels and size-based rotation
 */

#pragma once

#include "celestiada/sdk/constants.hpp"
#include <string>
#include <mutex>
#include <fstream>
#include <cstdint>

namespace celestiada {
namespace sdk {

/**
 * @brief Logging facility with different log levels and rotation
 *
 * Until initialize() is called, messages at or above the minimum level go to
 * stderr, so the library can be used without any logging setup.
 */
class Logger {
public:
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Get the singleton instance of the logger
     * @return Reference to the singleton instance
     */
    static Logger& instance();

    /**
     * @brief Whether initialize() has been called on the singleton
     */
    static bool is_initialized();

    /**
     * @brief Initialize the logger
     * @param log_path Directory to store log files
     * @param min_level Minimum log level to record
     */
    void initialize(const std::string& log_path = constants::LOG_PATH,
                    LogLevel min_level = LogLevel::INFO);

    /**
     * @brief Log a message with a specific level
     */
    void log(LogLevel level, const std::string& message);

    // Convenience methods for different log levels
    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    ~Logger();

    LogLevel get_log_level() const;
    void set_log_level(LogLevel level);
    bool is_level_enabled(LogLevel level) const;

    std::string get_log_path() const;

    /**
     * @brief Parse a level name (trace, debug, info, warning, error, critical)
     * @return The parsed level, or INFO for unknown names
     */
    static LogLevel level_from_string(const std::string& name);

    static std::string level_to_string(LogLevel level);

    void flush();

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Callers hold log_mutex_
    void log_internal(LogLevel level, const std::string& message);
    void open_log_file();
    void check_and_rotate_log();

    static std::string get_current_timestamp(const char* format = "%Y-%m-%d %H:%M:%S");

    static std::mutex instance_mutex_;
    static Logger* instance_;

    mutable std::mutex log_mutex_;
    std::ofstream log_file_;
    std::string log_path_;
    LogLevel min_level_ = LogLevel::INFO;
    bool initialized_ = false;
    size_t max_log_file_size_ = constants::MAX_LOG_FILE_SIZE;
};

} // namespace sdk
} // namespace celestiada

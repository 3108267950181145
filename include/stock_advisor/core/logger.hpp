// include/stock_advisor/core/logger.hpp
#pragma once

#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "stock_advisor/core/config_base.hpp"

namespace stock_advisor {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // General information
    WARNING,  // Degraded but valid outcomes (skipped tickers, fallbacks)
    ERR,      // Request-level failures
    FATAL     // Startup failures
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard error
    FILE,     // File output
    BOTH      // Both console and file
};

std::string level_to_string(LogLevel level);
LogLevel level_from_string(const std::string& level, LogLevel fallback = LogLevel::INFO);
std::string log_destination_to_string(LogDestination dest);
LogDestination log_destination_from_string(const std::string& dest,
                                           LogDestination fallback = LogDestination::CONSOLE);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"stock_advisor"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{10 * 1024 * 1024};  // Rotate after 10MB
    size_t max_files{5};                     // Files kept in log_directory

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe logging singleton
 *
 * Console output goes to stderr so that the CLI can keep stdout for its JSON response.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @param config Logger configuration
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    /**
     * @brief Log a message with specified level
     */
    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void open_log_file();
    void prune_log_files();
    void rotate_log_files();
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    std::string session_timestamp_;  // YYYYMMDD_HHMMSS
    int part_number_{1};
    static thread_local std::string current_component_;
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                                          \
    do {                                                                             \
        if (level >= ::stock_advisor::Logger::instance().get_min_level()) {          \
            std::ostringstream os;                                                   \
            os << message;                                                           \
            ::stock_advisor::Logger::instance().log(level, os.str());                \
        }                                                                            \
    } while (0)

#define TRACE(message) LOG(::stock_advisor::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::stock_advisor::LogLevel::DEBUG, message)
#define INFO(message) LOG(::stock_advisor::LogLevel::INFO, message)
#define WARN(message) LOG(::stock_advisor::LogLevel::WARNING, message)
#define ERROR(message) LOG(::stock_advisor::LogLevel::ERR, message)
#define FATAL(message) LOG(::stock_advisor::LogLevel::FATAL, message)

}  // namespace stock_advisor

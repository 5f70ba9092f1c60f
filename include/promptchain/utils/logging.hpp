#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace promptchain::utils {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Fixed-width level tag used in log lines ("DEBUG", "INFO ", ...)
 */
const char* log_level_tag(LogLevel level);

/**
 * @brief Parse a level name (debug, info, warn, error), case-insensitive
 * @return Parsed level, or nullopt for an unknown name
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Process-wide, thread-safe logger
 *
 * Lines go to stdout and, when set, to an append-mode log file. Messages
 * below the minimum level are dropped before any formatting happens.
 */
class Logger {
public:
    static Logger& get_instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level) { min_level_.store(level); }
    LogLevel get_level() const { return min_level_.load(); }

    bool is_enabled(LogLevel level) const { return level >= min_level_.load(); }

    void set_console_output(bool enabled) { console_output_.store(enabled); }

    /**
     * @brief Append lines to `filename`, replacing any previous log file
     */
    void set_log_file(const std::string& filename);

    void close_log_file();

    /**
     * @brief Apply PROMPTCHAIN_LOG_LEVEL and PROMPTCHAIN_LOG_FILE
     *
     * Unset variables leave the current settings untouched. An unknown level
     * name is reported at WARN and ignored.
     */
    void configure_from_env();

    void log(LogLevel level, const std::string& message);

    // Lines accepted since start-up, across all levels
    uint64_t get_total_messages() const { return total_messages_.load(); }

private:
    Logger() = default;

    static std::string format_line(LogLevel level, const std::string& message,
                                   std::chrono::system_clock::time_point when);
    void write_line(const std::string& line);

    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::atomic<bool> console_output_{true};
    std::atomic<uint64_t> total_messages_{0};

    std::mutex sink_mutex_;
    std::unique_ptr<std::ofstream> file_sink_;
};

#define LOG_DEBUG(message) \
    promptchain::utils::Logger::get_instance().log(promptchain::utils::LogLevel::DEBUG, message)

#define LOG_INFO(message) \
    promptchain::utils::Logger::get_instance().log(promptchain::utils::LogLevel::INFO, message)

#define LOG_WARN(message) \
    promptchain::utils::Logger::get_instance().log(promptchain::utils::LogLevel::WARN, message)

#define LOG_ERROR(message) \
    promptchain::utils::Logger::get_instance().log(promptchain::utils::LogLevel::ERROR, message)

} // namespace promptchain::utils

#include "promptchain/utils/logging.hpp"
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace promptchain::utils {

const char* log_level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::ERROR;
    return std::nullopt;
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

void Logger::set_log_file(const std::string& filename) {
    auto sink = std::make_unique<std::ofstream>(filename, std::ios::app);

    std::lock_guard<std::mutex> lock(sink_mutex_);
    file_sink_ = std::move(sink);
}

void Logger::close_log_file() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    file_sink_.reset();
}

void Logger::configure_from_env() {
    if (const char* level_name = std::getenv("PROMPTCHAIN_LOG_LEVEL")) {
        if (auto level = parse_log_level(level_name)) {
            set_level(*level);
        } else {
            log(LogLevel::WARN, std::string("Ignoring unknown PROMPTCHAIN_LOG_LEVEL: ") + level_name);
        }
    }

    const char* file_name = std::getenv("PROMPTCHAIN_LOG_FILE");
    if (file_name && *file_name != '\0') {
        set_log_file(file_name);
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!is_enabled(level)) {
        return;
    }

    total_messages_++;
    write_line(format_line(level, message, std::chrono::system_clock::now()));
}

std::string Logger::format_line(LogLevel level, const std::string& message,
                                std::chrono::system_clock::time_point when) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    // 2024-01-31 12:00:00.042 [INFO ] message
    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
         << '.' << std::setfill('0') << std::setw(3) << millis
         << " [" << log_level_tag(level) << "] " << message;
    return line.str();
}

void Logger::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(sink_mutex_);

    if (console_output_.load()) {
        std::cout << line << '\n';
    }

    if (file_sink_ && file_sink_->is_open()) {
        *file_sink_ << line << std::endl;
    }
}

} // namespace promptchain::utils

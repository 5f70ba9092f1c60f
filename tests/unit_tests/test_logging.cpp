#include <catch2/catch.hpp>
#include "promptchain/utils/logging.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

using namespace promptchain::utils;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("Logger - Basic Operations", "[utils][logging]") {
    SECTION("Singleton access") {
        Logger& logger1 = Logger::get_instance();
        Logger& logger2 = Logger::get_instance();
        REQUIRE(&logger1 == &logger2);
    }

    SECTION("Message counting") {
        Logger& logger = Logger::get_instance();
        logger.set_console_output(false);
        uint64_t initial_count = logger.get_total_messages();

        logger.log(LogLevel::INFO, "Test message 1");
        logger.log(LogLevel::ERROR, "Test message 2");

        REQUIRE(logger.get_total_messages() == initial_count + 2);
        logger.set_console_output(true);
    }
}

TEST_CASE("Logger - Level Filtering", "[utils][logging]") {
    Logger& logger = Logger::get_instance();
    logger.set_console_output(false);

    SECTION("INFO level filtering") {
        logger.set_level(LogLevel::INFO);
        uint64_t initial_count = logger.get_total_messages();

        logger.log(LogLevel::DEBUG, "Debug message - should be filtered");
        logger.log(LogLevel::INFO, "Info message - should pass");
        logger.log(LogLevel::WARN, "Warning message - should pass");
        logger.log(LogLevel::ERROR, "Error message - should pass");

        REQUIRE(logger.get_total_messages() == initial_count + 3);
    }

    SECTION("ERROR level filtering") {
        logger.set_level(LogLevel::ERROR);
        uint64_t initial_count = logger.get_total_messages();

        LOG_DEBUG("Debug message - should be filtered");
        LOG_INFO("Info message - should be filtered");
        LOG_WARN("Warning message - should be filtered");
        LOG_ERROR("Error message - should pass");

        REQUIRE(logger.get_total_messages() == initial_count + 1);
    }

    logger.set_level(LogLevel::INFO);
    logger.set_console_output(true);
}

TEST_CASE("Logger - File Logging", "[utils][logging]") {
    Logger& logger = Logger::get_instance();
    std::string test_file = "promptchain_test_log.txt";
    std::remove(test_file.c_str());

    logger.set_console_output(false);
    logger.set_log_file(test_file);
    logger.log(LogLevel::WARN, "Test file message");
    logger.close_log_file();

    std::string content = read_file(test_file);
    REQUIRE(content.find("[WARN ] Test file message") != std::string::npos);

    logger.set_console_output(true);
    std::remove(test_file.c_str());
}

TEST_CASE("Logger - Replacing the log file", "[utils][logging]") {
    Logger& logger = Logger::get_instance();
    std::string first = "promptchain_first_log.txt";
    std::string second = "promptchain_second_log.txt";
    std::remove(first.c_str());
    std::remove(second.c_str());

    logger.set_console_output(false);
    logger.set_log_file(first);
    logger.log(LogLevel::ERROR, "to the first file");
    logger.set_log_file(second);
    logger.log(LogLevel::ERROR, "to the second file");
    logger.close_log_file();
    logger.log(LogLevel::ERROR, "to no file");

    REQUIRE(read_file(first).find("to the first file") != std::string::npos);
    REQUIRE(read_file(first).find("to the second file") == std::string::npos);
    REQUIRE(read_file(second).find("to the second file") != std::string::npos);
    REQUIRE(read_file(second).find("to no file") == std::string::npos);

    logger.set_console_output(true);
    std::remove(first.c_str());
    std::remove(second.c_str());
}

TEST_CASE("Logger - Enabled levels", "[utils][logging]") {
    Logger& logger = Logger::get_instance();
    logger.set_level(LogLevel::WARN);

    REQUIRE_FALSE(logger.is_enabled(LogLevel::DEBUG));
    REQUIRE_FALSE(logger.is_enabled(LogLevel::INFO));
    REQUIRE(logger.is_enabled(LogLevel::WARN));
    REQUIRE(logger.is_enabled(LogLevel::ERROR));

    logger.set_level(LogLevel::INFO);
}

TEST_CASE("Logger - Level tags", "[utils][logging]") {
    REQUIRE(std::string(log_level_tag(LogLevel::DEBUG)) == "DEBUG");
    REQUIRE(std::string(log_level_tag(LogLevel::INFO)) == "INFO ");
    REQUIRE(std::string(log_level_tag(LogLevel::WARN)) == "WARN ");
    REQUIRE(std::string(log_level_tag(LogLevel::ERROR)) == "ERROR");
}

TEST_CASE("Logger - Level names", "[utils][logging][config]") {
    REQUIRE(parse_log_level("debug") == LogLevel::DEBUG);
    REQUIRE(parse_log_level("INFO") == LogLevel::INFO);
    REQUIRE(parse_log_level("Warning") == LogLevel::WARN);
    REQUIRE(parse_log_level("error") == LogLevel::ERROR);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
}

TEST_CASE("Logger - Environment configuration", "[utils][logging][config]") {
    Logger& logger = Logger::get_instance();
    logger.set_console_output(false);
    logger.set_level(LogLevel::INFO);

    SECTION("Known level is applied") {
        setenv("PROMPTCHAIN_LOG_LEVEL", "error", 1);
        logger.configure_from_env();
        REQUIRE(logger.get_level() == LogLevel::ERROR);
    }

    SECTION("Unknown level leaves the level unchanged") {
        setenv("PROMPTCHAIN_LOG_LEVEL", "chatty", 1);
        logger.configure_from_env();
        REQUIRE(logger.get_level() == LogLevel::INFO);
    }

    SECTION("Log file from the environment") {
        std::string test_file = "promptchain_env_log.txt";
        std::remove(test_file.c_str());
        unsetenv("PROMPTCHAIN_LOG_LEVEL");
        setenv("PROMPTCHAIN_LOG_FILE", test_file.c_str(), 1);

        logger.configure_from_env();
        LOG_INFO("Routed through the environment");
        logger.close_log_file();

        REQUIRE(read_file(test_file).find("Routed through the environment") != std::string::npos);
        std::remove(test_file.c_str());
        unsetenv("PROMPTCHAIN_LOG_FILE");
    }

    unsetenv("PROMPTCHAIN_LOG_LEVEL");
    logger.set_level(LogLevel::INFO);
    logger.set_console_output(true);
}

TEST_CASE("Logger - Thread Safety", "[utils][logging][thread_safety]") {
    Logger& logger = Logger::get_instance();
    logger.set_level(LogLevel::INFO);
    logger.set_console_output(false);

    uint64_t initial_count = logger.get_total_messages();
    const int num_threads = 4;
    const int messages_per_thread = 10;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&logger, t, messages_per_thread]() {
            for (int i = 0; i < messages_per_thread; ++i) {
                logger.log(LogLevel::INFO, "Thread " + std::to_string(t) + " message " + std::to_string(i));
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(logger.get_total_messages() == initial_count + (num_threads * messages_per_thread));
    logger.set_console_output(true);
}

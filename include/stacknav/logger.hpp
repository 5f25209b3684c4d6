#ifndef STACKNAV_LOGGER_HPP
#define STACKNAV_LOGGER_HPP

#include <string>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <mutex>
#include <chrono>
#include <iomanip>

namespace stacknav {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& instance();

    // An empty logPath keeps output on the console only.
    void init(const std::filesystem::path& logPath, bool verbose);
    void setVerbose(bool verbose);
    bool verbose() const { return verbose_; }

    void log(LogLevel level, const std::string& message);

    // Forbidden
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    std::ofstream logFile_;
    bool verbose_ = false;
    std::mutex mutex_;

    std::string getTimestamp();
    std::string getLevelString(LogLevel level);
};

// Convenience macros
#define LOG_DEBUG(msg) stacknav::Logger::instance().log(stacknav::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) stacknav::Logger::instance().log(stacknav::LogLevel::INFO, msg)
#define LOG_WARN(msg) stacknav::Logger::instance().log(stacknav::LogLevel::WARNING, msg)
#define LOG_ERROR(msg) stacknav::Logger::instance().log(stacknav::LogLevel::ERROR, msg)

} // namespace stacknav

#endif // STACKNAV_LOGGER_HPP

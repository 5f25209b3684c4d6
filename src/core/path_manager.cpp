#include "stacknav/path_manager.hpp"
#include "stacknav/logger.hpp"
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace stacknav {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

bool PathManager::init(const std::string& rootOverride) {
    const char* envPath = std::getenv("STACKNAV_PATH");
    std::string root = rootOverride;
    if (root.empty() && envPath && strlen(envPath) > 0) root = envPath;

    if (!root.empty()) {
        std::filesystem::path base = std::filesystem::absolute(root);
        configDir_ = base;
        logsDir_ = base / "logs";
    } else {
        configDir_ = xdgDir("XDG_CONFIG_HOME", ".config") / "stacknav";
        logsDir_ = xdgDir("XDG_DATA_HOME", std::filesystem::path(".local") / "share") / "stacknav" / "logs";
    }

    std::error_code ec;
    std::filesystem::create_directories(configDir_, ec);
    if (!ec) std::filesystem::create_directories(logsDir_, ec);
    if (ec) {
        LOG_ERROR("Failed to create directories: " + ec.message());
        return false;
    }

    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << "stacknav_" << std::put_time(std::localtime(&in_time_t), "%Y%m%d_%H%M%S") << ".log";
    currentLogPath_ = logsDir_ / ss.str();
    return true;
}

std::filesystem::path PathManager::xdgDir(const char* var, const std::filesystem::path& homeFallback) {
    const char* xdg = std::getenv(var);
    if (xdg && strlen(xdg) > 0) return std::filesystem::absolute(xdg);

    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp"; // Should never happen on Linux
    return std::filesystem::path(home) / homeFallback;
}

} // namespace stacknav

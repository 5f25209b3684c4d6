#ifndef STACKNAV_PATH_MANAGER_HPP
#define STACKNAV_PATH_MANAGER_HPP

#include <string>
#include <filesystem>

namespace stacknav {

class PathManager {
public:
    static PathManager& instance();

    // If rootOverride is empty, checks STACKNAV_PATH, then XDG defaults.
    // Returns false if the directories could not be created.
    bool init(const std::string& rootOverride = "");

    std::filesystem::path configDir() const { return configDir_; }
    std::filesystem::path configFile() const { return configDir_ / "config.json"; }
    std::filesystem::path logs() const { return logsDir_; }

    // Path to the current session's log file
    std::filesystem::path currentLog() const { return currentLogPath_; }

private:
    PathManager() = default;

    std::filesystem::path configDir_;
    std::filesystem::path logsDir_;
    std::filesystem::path currentLogPath_;

    static std::filesystem::path xdgDir(const char* var, const std::filesystem::path& homeFallback);
};

} // namespace stacknav

#endif // STACKNAV_PATH_MANAGER_HPP

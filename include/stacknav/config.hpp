#ifndef STACKNAV_CONFIG_HPP
#define STACKNAV_CONFIG_HPP

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace stacknav {

struct WindowConfig {
  int width = 960;
  int height = 640;
  std::string title = "stacknav";
  bool resizable = true;
};

// Screens the demo host can start on
namespace Presets {
inline const std::vector<std::string> StartScreens = {"login", "home"};
} // namespace Presets

struct NavigationConfig {
  std::string startScreen = "login";
  int idleTimeoutMs = 250; // event wait when nothing is pending
};

struct LoggingConfig {
  bool verbose = false;
};

class Config {
public:
  static Config &instance();

  // Missing file: defaults are written out. Malformed file: error is logged
  // and defaults are kept.
  void load(const std::filesystem::path &configPath);
  bool save();

  // Back to built-in defaults, keeps the path.
  void reset();

  // Getters
  WindowConfig &getWindow() { return window_; }
  NavigationConfig &getNavigation() { return navigation_; }
  LoggingConfig &getLogging() { return logging_; }
  const std::filesystem::path &path() const { return configPath_; }
  std::recursive_mutex &getMutex() { return mutex_; }

  nlohmann::json toJson() const;

  // Forbidden
  Config(const Config &) = delete;
  Config &operator=(const Config &) = delete;

private:
  Config() = default;
  ~Config() = default;

  void fromJson(const nlohmann::json &j);

  std::filesystem::path configPath_;
  WindowConfig window_;
  NavigationConfig navigation_;
  LoggingConfig logging_;

  mutable std::recursive_mutex mutex_;
};

} // namespace stacknav

#endif // STACKNAV_CONFIG_HPP

#include "stacknav/config.hpp"
#include "stacknav/logger.hpp"
#include <algorithm>
#include <fstream>

namespace stacknav {

using json = nlohmann::json;

Config &Config::instance() {
  static Config instance;
  return instance;
}

void Config::load(const std::filesystem::path &path) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  configPath_ = path;

  if (!std::filesystem::exists(path)) {
    LOG_WARN("Config file not found at " + path.string() + ". Using defaults.");
    save();
    return;
  }

  try {
    std::ifstream file(path);
    json j;
    file >> j;
    fromJson(j);
    LOG_INFO("Configuration loaded from " + path.string());
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to parse config file: " + std::string(e.what()));
    reset();
  }
}

void Config::fromJson(const json &j) {
  WindowConfig window;
  NavigationConfig navigation;
  LoggingConfig logging;

  if (j.contains("window")) {
    auto &w = j["window"];
    window.width = w.value("width", window.width);
    window.height = w.value("height", window.height);
    window.title = w.value("title", window.title);
    window.resizable = w.value("resizable", window.resizable);
  }

  if (j.contains("navigation")) {
    auto &n = j["navigation"];
    navigation.startScreen = n.value("start_screen", navigation.startScreen);
    navigation.idleTimeoutMs =
        n.value("idle_timeout_ms", navigation.idleTimeoutMs);
  }

  if (j.contains("logging")) {
    logging.verbose = j["logging"].value("verbose", logging.verbose);
  }

  if (window.width <= 0 || window.height <= 0) {
    LOG_WARN("Invalid window size " + std::to_string(window.width) + "x" +
             std::to_string(window.height) + ", using defaults");
    window.width = WindowConfig{}.width;
    window.height = WindowConfig{}.height;
  }

  const auto &known = Presets::StartScreens;
  if (std::find(known.begin(), known.end(), navigation.startScreen) ==
      known.end()) {
    LOG_WARN("Unknown start screen '" + navigation.startScreen +
             "', falling back to '" + NavigationConfig{}.startScreen + "'");
    navigation.startScreen = NavigationConfig{}.startScreen;
  }

  if (navigation.idleTimeoutMs < 0)
    navigation.idleTimeoutMs = 0;

  window_ = window;
  navigation_ = navigation;
  logging_ = logging;
}

json Config::toJson() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  json j;
  j["window"] = {{"width", window_.width},
                 {"height", window_.height},
                 {"title", window_.title},
                 {"resizable", window_.resizable}};
  j["navigation"] = {{"start_screen", navigation_.startScreen},
                     {"idle_timeout_ms", navigation_.idleTimeoutMs}};
  j["logging"]["verbose"] = logging_.verbose;
  return j;
}

bool Config::save() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (configPath_.empty())
    return false;

  std::error_code ec;
  if (configPath_.has_parent_path()) {
    std::filesystem::create_directories(configPath_.parent_path(), ec);
    if (ec) {
      LOG_ERROR("Failed to create config directory: " + ec.message());
      return false;
    }
  }

  std::ofstream file(configPath_);
  if (!file.is_open()) {
    LOG_ERROR("Failed to write config file: " + configPath_.string());
    return false;
  }
  file << toJson().dump(4);
  LOG_INFO("Configuration saved to " + configPath_.string());
  return true;
}

void Config::reset() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  window_ = WindowConfig{};
  navigation_ = NavigationConfig{};
  logging_ = LoggingConfig{};
}

} // namespace stacknav

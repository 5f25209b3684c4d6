#include "stacknav/app_state.hpp"
#include "stacknav/config.hpp"
#include "stacknav/gui.hpp"
#include "stacknav/logger.hpp"
#include "stacknav/path_manager.hpp"
#include "stacknav/screens/HomeScreen.hpp"
#include "stacknav/screens/LoginScreen.hpp"
#include "stacknav/version.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

void showHelp() {
  std::cout << "stacknav - screen navigation demo\n\n"
            << "Usage: stacknav [flags]\n\n"
            << "Flags:\n"
            << "  -h, --help       Show this help message\n"
            << "  --version        Print the version and exit\n"
            << "  -v, --verbose    Enable verbose logging to stdout\n"
            << "  --root <dir>     Keep config and logs under <dir>\n"
            << "  --start <id>     First screen: login or home\n";
}

// Removes "flag value" from args and returns value, or "" if absent.
static std::string takeOption(std::vector<std::string> &args,
                              const std::string &flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end())
    return "";
  if (it + 1 == args.end()) {
    std::cerr << "Missing value for " << flag << "\n";
    args.erase(it);
    return "";
  }
  std::string value = *(it + 1);
  args.erase(it, it + 2);
  return value;
}

int main(int argc, char *argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);

  if (!args.empty() &&
      (args[0] == "help" || args[0] == "--help" || args[0] == "-h")) {
    showHelp();
    return 0;
  }

  if (!args.empty() && args[0] == "--version") {
    std::cout << "stacknav v" << stacknav::STACKNAV_VERSION_STRING << "\n";
    return 0;
  }

  bool verbose = false;
  auto it = std::find_if(args.begin(), args.end(), [](const std::string &arg) {
    return arg == "-v" || arg == "--verbose";
  });
  if (it != args.end()) {
    verbose = true;
    args.erase(it);
  }

  std::string root = takeOption(args, "--root");
  std::string start = takeOption(args, "--start");

  for (const auto &arg : args)
    std::cerr << "Ignoring unknown argument: " << arg << "\n";

  auto &pathMgr = stacknav::PathManager::instance();
  if (!pathMgr.init(root))
    return 1;

  stacknav::Logger::instance().init(pathMgr.currentLog(), verbose);
  LOG_INFO("=== stacknav v" + stacknav::STACKNAV_VERSION_STRING + " ===");

  auto &config = stacknav::Config::instance();
  config.load(pathMgr.configFile());
  if (config.getLogging().verbose)
    stacknav::Logger::instance().setVerbose(true);

  if (start.empty())
    start = config.getNavigation().startScreen;

  auto &gui = stacknav::GUI::instance();
  if (!gui.init(config.getWindow())) {
    LOG_ERROR("Failed to initialize GUI");
    return 1;
  }

  stacknav::Context &cx = gui.context();
  stacknav::Entity<stacknav::AppState> app = cx.create(stacknav::AppState());
  stacknav::WeakEntity<stacknav::AppState> weakApp = stacknav::downgrade(app);

  // Home needs a user; starting there signs in as the login name.
  if (start == "home") {
    const char *user = std::getenv("USER");
    app->signIn(user ? user : "guest", cx);
    app->navigator().push(stacknav::HomeScreen(weakApp), cx);
  } else {
    if (start != "login")
      LOG_WARN("Unknown start screen '" + start + "', showing login");
    app->navigator().push(stacknav::LoginScreen(weakApp), cx);
  }

  gui.run(app, config.getNavigation().idleTimeoutMs);

  LOG_INFO("Shutting down");
  // Release through the context so screens still open get onExit (Settings
  // saves pending changes there).
  app->navigator().clear(gui.context());
  gui.context().collect();
  app.reset();
  gui.shutdown();
  return 0;
}

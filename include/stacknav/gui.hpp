#ifndef STACKNAV_GUI_HPP
#define STACKNAV_GUI_HPP

#include "stacknav/app_state.hpp"
#include "stacknav/config.hpp"
#include "stacknav/context.hpp"
#include <string>

namespace stacknav {

// Window host: owns the GLFW window, the ImGui context and the mutation
// Context, and draws the navigator's current screen every frame.
class GUI {
public:
  static GUI &instance();

  bool init(const WindowConfig &window);

  // Blocks until the window is closed. Waits up to idleTimeoutMs for input
  // when no redraw has been requested.
  void run(const Entity<AppState> &app, int idleTimeoutMs);

  Context &context() { return cx_; }

  void showMessage(const std::string &title, const std::string &message);

  void close();
  void shutdown();

  GUI(const GUI &) = delete;
  GUI &operator=(const GUI &) = delete;

private:
  GUI() = default;
  ~GUI();

  void renderTitleBar(AppState &app, float width);
  void renderStatusLine(const AppState &app);
  void renderMessageModal();

  Context cx_;

  // Message Modal State
  bool showMessageModal_ = false;
  std::string messageTitle_;
  std::string messageText_;

  bool shouldClose_ = false;
  bool initialized_ = false;

  void *window_ = nullptr;
};

} // namespace stacknav

#endif // STACKNAV_GUI_HPP

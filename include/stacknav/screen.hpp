#ifndef STACKNAV_SCREEN_HPP
#define STACKNAV_SCREEN_HPP

#include "stacknav/context.hpp"
#include <string>

namespace stacknav {

// A full-page view that can live on the navigation stack.
class Screen {
public:
  virtual ~Screen() = default;

  // Diagnostic identifier. Need not be unique.
  virtual std::string id() const = 0;

  // Draws the screen for the current frame. Event handlers inside may mutate
  // the navigator through cx, including popping this very screen.
  virtual void render(Context &cx) = 0;

  virtual std::string title() const { return id(); }

  // Called once the screen has been placed on top of the stack.
  virtual void onEnter(Context &) {}
  // Called once the screen has been removed from the stack.
  virtual void onExit(Context &) {}
};

// One stack entry: the screen plus the id it declared when pushed.
struct ScreenHandle {
  std::string id;
  Entity<Screen> instance;
};

} // namespace stacknav

#endif // STACKNAV_SCREEN_HPP

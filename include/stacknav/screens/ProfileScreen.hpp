#ifndef STACKNAV_PROFILESCREEN_HPP
#define STACKNAV_PROFILESCREEN_HPP

#include "stacknav/app_state.hpp"
#include "stacknav/screen.hpp"
#include "stacknav/screen_context.hpp"
#include <chrono>

namespace stacknav {

class ProfileScreen : public Screen {
public:
  explicit ProfileScreen(WeakEntity<AppState> appState);

  std::string id() const override { return "profile"; }
  std::string title() const override { return "Profile"; }
  void render(Context &cx) override;
  void onEnter(Context &cx) override;

private:
  ScreenContext<AppState> ctx_;
  std::chrono::steady_clock::time_point enteredAt_;
};

} // namespace stacknav

#endif // STACKNAV_PROFILESCREEN_HPP

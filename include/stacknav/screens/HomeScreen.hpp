#ifndef STACKNAV_HOMESCREEN_HPP
#define STACKNAV_HOMESCREEN_HPP

#include "stacknav/app_state.hpp"
#include "stacknav/screen.hpp"
#include "stacknav/screen_context.hpp"

namespace stacknav {

class HomeScreen : public Screen {
public:
  explicit HomeScreen(WeakEntity<AppState> appState);

  std::string id() const override { return "home"; }
  std::string title() const override { return "Home"; }
  void render(Context &cx) override;
  void onEnter(Context &cx) override;

private:
  ScreenContext<AppState> ctx_;
  int visits_ = 0;
};

} // namespace stacknav

#endif // STACKNAV_HOMESCREEN_HPP

#ifndef STACKNAV_LOGINSCREEN_HPP
#define STACKNAV_LOGINSCREEN_HPP

#include "stacknav/app_state.hpp"
#include "stacknav/screen.hpp"
#include "stacknav/screen_context.hpp"
#include <array>

namespace stacknav {

class LoginScreen : public Screen {
public:
  explicit LoginScreen(WeakEntity<AppState> appState);

  std::string id() const override { return "login"; }
  std::string title() const override { return "Sign in"; }
  void render(Context &cx) override;

private:
  ScreenContext<AppState> ctx_;
  std::array<char, 64> user_{};
  bool showError_ = false;
};

} // namespace stacknav

#endif // STACKNAV_LOGINSCREEN_HPP

#ifndef STACKNAV_SETTINGSSCREEN_HPP
#define STACKNAV_SETTINGSSCREEN_HPP

#include "stacknav/app_state.hpp"
#include "stacknav/screen.hpp"
#include "stacknav/screen_context.hpp"

namespace stacknav {

class SettingsScreen : public Screen {
public:
  explicit SettingsScreen(WeakEntity<AppState> appState);

  std::string id() const override { return "settings"; }
  std::string title() const override { return "Settings"; }
  void render(Context &cx) override;
  void onExit(Context &cx) override;

private:
  void renderGeneralTab();
  void renderAccountTab(Context &cx);
  void saveIfDirty();

  ScreenContext<AppState> ctx_;
  bool configDirty_ = false;
};

} // namespace stacknav

#endif // STACKNAV_SETTINGSSCREEN_HPP

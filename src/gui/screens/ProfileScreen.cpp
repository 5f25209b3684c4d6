#include "stacknav/screens/ProfileScreen.hpp"
#include "imgui.h"
#include "stacknav/screens/SettingsScreen.hpp"

namespace stacknav {

ProfileScreen::ProfileScreen(WeakEntity<AppState> appState)
    : ctx_(std::move(appState)) {}

void ProfileScreen::onEnter(Context &) {
  enteredAt_ = std::chrono::steady_clock::now();
}

void ProfileScreen::render(Context &cx) {
  Entity<AppState> app = ctx_.appState().upgrade();
  if (!app)
    return;

  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                     std::chrono::steady_clock::now() - enteredAt_)
                     .count();

  ImGui::Text("Name: %s", app->user().c_str());
  ImGui::Text("On this screen for %lld s", (long long)seconds);
  ImGui::Spacing();

  // Swap rather than stack: Back from settings returns to home.
  if (ImGui::Button("EDIT SETTINGS", ImVec2(180, 40))) {
    ctx_.update(cx, [&](AppState &state, Context &inner) {
      state.navigator().replace(SettingsScreen(ctx_.appState()), inner);
    });
  }
}

} // namespace stacknav

#include "stacknav/screens/HomeScreen.hpp"
#include "imgui.h"
#include "stacknav/logger.hpp"
#include "stacknav/screens/ProfileScreen.hpp"
#include "stacknav/screens/SettingsScreen.hpp"

namespace stacknav {

HomeScreen::HomeScreen(WeakEntity<AppState> appState)
    : ctx_(std::move(appState)) {}

void HomeScreen::onEnter(Context &) {
  ++visits_;
  LOG_DEBUG("Home entered");
}

void HomeScreen::render(Context &cx) {
  Entity<AppState> app = ctx_.appState().upgrade();
  if (!app)
    return;

  ImGui::Text("Welcome, %s", app->user().c_str());
  ImGui::Spacing();

  float buttonWidth = 150.0f;
  if (ImGui::Button("PROFILE", ImVec2(buttonWidth, 40))) {
    ctx_.update(cx, [&](AppState &state, Context &inner) {
      state.navigator().push(ProfileScreen(ctx_.appState()), inner);
    });
  }
  ImGui::SameLine();
  if (ImGui::Button("SETTINGS", ImVec2(buttonWidth, 40))) {
    ctx_.update(cx, [&](AppState &state, Context &inner) {
      state.navigator().push(SettingsScreen(ctx_.appState()), inner);
    });
  }

  ImGui::Spacing();
  ImGui::Separator();
  ImGui::Spacing();

  // History is read from the app state, not cached: it changes under us.
  ImGui::TextDisabled("History");
  for (const auto &screenId : app->navigator().history())
    ImGui::BulletText("%s", screenId.c_str());
}

} // namespace stacknav

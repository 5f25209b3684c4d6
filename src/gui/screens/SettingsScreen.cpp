#include "stacknav/screens/SettingsScreen.hpp"
#include "imgui.h"
#include "stacknav/config.hpp"
#include "stacknav/gui.hpp"
#include "stacknav/logger.hpp"
#include "stacknav/screens/LoginScreen.hpp"

namespace stacknav {

SettingsScreen::SettingsScreen(WeakEntity<AppState> appState)
    : ctx_(std::move(appState)) {}

void SettingsScreen::render(Context &cx) {
  if (ImGui::BeginTabBar("SettingsTabs")) {
    if (ImGui::BeginTabItem("General")) {
      renderGeneralTab();
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Account")) {
      renderAccountTab(cx);
      ImGui::EndTabItem();
    }
    ImGui::EndTabBar();
  }
}

void SettingsScreen::renderGeneralTab() {
  auto &cfg = Config::instance();
  std::lock_guard<std::recursive_mutex> lock(cfg.getMutex());
  auto &logging = cfg.getLogging();
  auto &nav = cfg.getNavigation();

  if (ImGui::Checkbox("Verbose logging", &logging.verbose)) {
    Logger::instance().setVerbose(logging.verbose);
    configDirty_ = true;
  }

  int current = nav.startScreen == "home" ? 1 : 0;
  const auto &choices = Presets::StartScreens;
  if (ImGui::BeginCombo("Start screen", choices[current].c_str())) {
    for (int i = 0; i < (int)choices.size(); ++i) {
      if (ImGui::Selectable(choices[i].c_str(), i == current)) {
        nav.startScreen = choices[i];
        configDirty_ = true;
      }
    }
    ImGui::EndCombo();
  }

  if (ImGui::InputInt("Idle wait (ms)", &nav.idleTimeoutMs)) {
    if (nav.idleTimeoutMs < 0)
      nav.idleTimeoutMs = 0;
    configDirty_ = true;
  }

  ImGui::Spacing();
  ImGui::TextDisabled("Changes are saved when leaving this screen.");
}

void SettingsScreen::renderAccountTab(Context &cx) {
  if (ImGui::Button("LOG OUT", ImVec2(150, 40))) {
    ctx_.update(cx, [&](AppState &app, Context &inner) {
      app.signOut(inner);
      app.navigator().clearAndPush(LoginScreen(ctx_.appState()), inner);
    });
  }
  ImGui::SameLine();
  if (ImGui::Button("QUIT", ImVec2(150, 40))) {
    saveIfDirty();
    GUI::instance().close();
  }
}

void SettingsScreen::onExit(Context &) { saveIfDirty(); }

void SettingsScreen::saveIfDirty() {
  if (!configDirty_)
    return;
  configDirty_ = false;
  if (!Config::instance().save())
    GUI::instance().showMessage("Settings", "Could not save configuration.");
}

} // namespace stacknav

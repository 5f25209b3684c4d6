#include "stacknav/screens/LoginScreen.hpp"
#include "imgui.h"
#include "stacknav/logger.hpp"
#include "stacknav/screens/HomeScreen.hpp"
#include <string>

namespace stacknav {

LoginScreen::LoginScreen(WeakEntity<AppState> appState)
    : ctx_(std::move(appState)) {}

void LoginScreen::render(Context &cx) {
  ImVec2 avail = ImGui::GetContentRegionAvail();
  float formWidth = 320.0f;
  float startX = (avail.x - formWidth) * 0.5f;

  ImGui::Dummy(ImVec2(0, avail.y * 0.25f));
  ImGui::SetCursorPosX(startX);
  ImGui::TextUnformatted("Enter a name to continue");

  ImGui::SetCursorPosX(startX);
  ImGui::SetNextItemWidth(formWidth);
  bool submitted =
      ImGui::InputText("##user", user_.data(), user_.size(),
                       ImGuiInputTextFlags_EnterReturnsTrue);

  ImGui::SetCursorPosX(startX);
  if (ImGui::Button("SIGN IN", ImVec2(formWidth, 36)))
    submitted = true;

  if (showError_) {
    ImGui::SetCursorPosX(startX);
    ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(0.9f, 0.3f, 0.3f, 1.0f));
    ImGui::TextUnformatted("Name must not be empty");
    ImGui::PopStyleColor();
  }

  if (!submitted)
    return;

  std::string user(user_.data());
  if (user.empty()) {
    showError_ = true;
    return;
  }
  showError_ = false;

  // Login is an authentication boundary: nothing before it stays reachable.
  bool applied = ctx_.update(cx, [&](AppState &app, Context &inner) {
    app.signIn(user, inner);
    app.navigator().clearAndPush(HomeScreen(ctx_.appState()), inner);
  });
  if (!applied)
    LOG_WARN("Login screen outlived the app state");
}

} // namespace stacknav

#include "stacknav/app_state.hpp"
#include "stacknav/logger.hpp"

namespace stacknav {

void AppState::signIn(const std::string &user, Context &cx) {
  user_ = user;
  LOG_INFO("Signed in as '" + user + "'");
  cx.notify();
}

void AppState::signOut(Context &cx) {
  if (user_.empty())
    return;
  LOG_INFO("Signed out '" + user_ + "'");
  user_.clear();
  cx.notify();
}

std::string AppState::describe() const {
  std::string out = signedIn() ? "User: " + user_ : "Signed out";
  out += " | Depth: " + std::to_string(navigator_.depth());
  if (const Screen *screen = navigator_.current())
    out += " | Screen: " + screen->id();
  return out;
}

} // namespace stacknav

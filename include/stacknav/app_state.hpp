#ifndef STACKNAV_APP_STATE_HPP
#define STACKNAV_APP_STATE_HPP

#include "stacknav/context.hpp"
#include "stacknav/navigator.hpp"
#include <string>

namespace stacknav {

// Shared application state of the demo host. Lives in an Entity so screens
// can hold a WeakEntity<AppState> back to it.
class AppState {
public:
  AppState() = default;

  AppState(const AppState &) = delete;
  AppState &operator=(const AppState &) = delete;
  AppState(AppState &&) = default;
  AppState &operator=(AppState &&) = default;

  Navigator &navigator() { return navigator_; }
  const Navigator &navigator() const { return navigator_; }

  void signIn(const std::string &user, Context &cx);
  void signOut(Context &cx);
  bool signedIn() const { return !user_.empty(); }
  const std::string &user() const { return user_; }

  // Human readable summary for the status line.
  std::string describe() const;

private:
  Navigator navigator_;
  std::string user_;
};

} // namespace stacknav

#endif // STACKNAV_APP_STATE_HPP

#ifndef STACKNAV_SCREEN_CONTEXT_HPP
#define STACKNAV_SCREEN_CONTEXT_HPP

#include "stacknav/context.hpp"
#include <optional>
#include <type_traits>
#include <utility>

namespace stacknav {

// Stored by each screen to reach the application state (and through it the
// navigator) without owning it.
//
//   class MyScreen : public Screen {
//     ScreenContext<AppState> ctx_;
//     ...
//     ctx_.update(cx, [&](AppState &app, Context &inner) {
//       app.navigator().push(NextScreen(ctx_.appState()), inner);
//     });
//   };
template <typename T> class ScreenContext {
public:
  ScreenContext() = default;
  explicit ScreenContext(WeakEntity<T> appState)
      : appState_(std::move(appState)) {}

  // Handle to pass on to screens created from this one.
  WeakEntity<T> appState() const { return appState_; }

  bool alive() const { return !appState_.expired(); }

  // Runs fn(T&, Context&) if the app state still exists. Returns the result
  // wrapped in std::optional, or for void callbacks whether fn ran.
  template <typename F> auto update(Context &cx, F &&fn) const {
    using R = std::invoke_result_t<F, T &, Context &>;
    Entity<T> app = appState_.upgrade();
    if constexpr (std::is_void_v<R>) {
      if (!app)
        return false;
      std::forward<F>(fn)(*app, cx);
      return true;
    } else {
      if (!app)
        return std::optional<R>();
      return std::optional<R>(std::forward<F>(fn)(*app, cx));
    }
  }

private:
  WeakEntity<T> appState_;
};

} // namespace stacknav

#endif // STACKNAV_SCREEN_CONTEXT_HPP

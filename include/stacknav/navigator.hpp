#ifndef STACKNAV_NAVIGATOR_HPP
#define STACKNAV_NAVIGATOR_HPP

#include "stacknav/context.hpp"
#include "stacknav/screen.hpp"
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace stacknav {

// Navigation stack. The last entry is the visible screen.
//
// Every operation that changes the stack calls cx.notify() exactly once,
// after the stack has reached its final state. Removed screens get onExit()
// and are handed to cx.defer() so they stay valid until the host's next
// collect().
class Navigator {
public:
  Navigator() = default;

  Navigator(const Navigator &) = delete;
  Navigator &operator=(const Navigator &) = delete;
  Navigator(Navigator &&) = default;
  Navigator &operator=(Navigator &&) = default;

  template <typename S> void push(S &&screen, Context &cx) {
    pushEntity(wrap(std::forward<S>(screen), cx), cx);
    cx.notify();
  }

  // Removes the top screen. Returns false (and does nothing) when empty.
  bool pop(Context &cx);

  // Swaps the top screen for a new one. On an empty stack the screen is
  // pushed and false is returned.
  template <typename S> bool replace(S &&screen, Context &cx) {
    return replaceEntity(wrap(std::forward<S>(screen), cx), cx);
  }

  // Drops the whole history, then pushes a single new root.
  template <typename S> void clearAndPush(S &&screen, Context &cx) {
    clearAndPushEntity(wrap(std::forward<S>(screen), cx), cx);
  }

  // Releases every screen (onExit top-first). Used at teardown so screens
  // still on the stack get their exit hook. Returns false when already empty.
  bool clear(Context &cx);

  // nullptr when nothing has been pushed yet.
  Screen *current() const;
  Entity<Screen> currentEntity() const;

  bool canGoBack() const { return stack_.size() > 1; }
  std::size_t depth() const { return stack_.size(); }
  bool empty() const { return stack_.empty(); }

  // Screen ids from bottom to top.
  std::vector<std::string> history() const;

private:
  std::vector<ScreenHandle> stack_;

  template <typename S> static Entity<Screen> wrap(S &&screen, Context &cx) {
    static_assert(std::is_base_of_v<Screen, std::decay_t<S>>,
                  "Navigator only accepts types derived from stacknav::Screen");
    return cx.create(std::forward<S>(screen));
  }

  void pushEntity(Entity<Screen> screen, Context &cx);
  bool replaceEntity(Entity<Screen> screen, Context &cx);
  void clearAndPushEntity(Entity<Screen> screen, Context &cx);
  void release(ScreenHandle handle, Context &cx);
  std::size_t releaseAll(Context &cx);
};

} // namespace stacknav

#endif // STACKNAV_NAVIGATOR_HPP

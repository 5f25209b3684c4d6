#include "stacknav/navigator.hpp"
#include "stacknav/logger.hpp"

namespace stacknav {

void Navigator::pushEntity(Entity<Screen> screen, Context &cx) {
  ScreenHandle handle{screen->id(), std::move(screen)};
  LOG_DEBUG("Navigator: push '" + handle.id + "' (depth " +
            std::to_string(stack_.size() + 1) + ")");
  Screen *entered = handle.instance.get();
  stack_.push_back(std::move(handle));
  entered->onEnter(cx);
}

bool Navigator::pop(Context &cx) {
  if (stack_.empty()) {
    LOG_DEBUG("Navigator: pop on empty stack ignored");
    return false;
  }

  ScreenHandle top = std::move(stack_.back());
  stack_.pop_back();
  LOG_DEBUG("Navigator: pop '" + top.id + "' (depth " +
            std::to_string(stack_.size()) + ")");
  release(std::move(top), cx);
  cx.notify();
  return true;
}

bool Navigator::replaceEntity(Entity<Screen> screen, Context &cx) {
  if (stack_.empty()) {
    LOG_DEBUG("Navigator: replace on empty stack, pushing '" + screen->id() +
              "'");
    pushEntity(std::move(screen), cx);
    cx.notify();
    return false;
  }

  ScreenHandle top = std::move(stack_.back());
  stack_.pop_back();
  LOG_DEBUG("Navigator: replace '" + top.id + "' with '" + screen->id() + "'");
  release(std::move(top), cx);
  pushEntity(std::move(screen), cx);
  cx.notify();
  return true;
}

void Navigator::clearAndPushEntity(Entity<Screen> screen, Context &cx) {
  LOG_DEBUG("Navigator: clearing " + std::to_string(stack_.size()) +
            " screen(s) before '" + screen->id() + "'");
  releaseAll(cx);
  pushEntity(std::move(screen), cx);
  cx.notify();
}

bool Navigator::clear(Context &cx) {
  if (stack_.empty())
    return false;
  LOG_DEBUG("Navigator: clearing " + std::to_string(stack_.size()) +
            " screen(s)");
  releaseAll(cx);
  cx.notify();
  return true;
}

std::size_t Navigator::releaseAll(Context &cx) {
  // Detach first: exit hooks see an empty stack, and anything they push
  // stays on it.
  std::vector<ScreenHandle> released;
  released.swap(stack_);
  for (auto it = released.rbegin(); it != released.rend(); ++it)
    release(std::move(*it), cx);
  return released.size();
}

void Navigator::release(ScreenHandle handle, Context &cx) {
  handle.instance->onExit(cx);
  cx.defer(std::move(handle.instance));
}

Screen *Navigator::current() const {
  return stack_.empty() ? nullptr : stack_.back().instance.get();
}

Entity<Screen> Navigator::currentEntity() const {
  return stack_.empty() ? nullptr : stack_.back().instance;
}

std::vector<std::string> Navigator::history() const {
  std::vector<std::string> ids;
  ids.reserve(stack_.size());
  for (const auto &handle : stack_)
    ids.push_back(handle.id);
  return ids;
}

} // namespace stacknav

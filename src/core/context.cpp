#include "stacknav/context.hpp"

namespace stacknav {

void Context::notify() {
  pending_ = true;
  ++notifyCount_;
  if (wake_)
    wake_();
}

bool Context::takeNotify() {
  bool pending = pending_;
  pending_ = false;
  return pending;
}

void Context::defer(std::shared_ptr<void> entity) {
  if (entity)
    deferred_.push_back(std::move(entity));
}

std::size_t Context::collect() {
  std::size_t dropped = deferred_.size();
  // Swap out first: a destructor running here may defer again.
  std::vector<std::shared_ptr<void>> released;
  released.swap(deferred_);
  released.clear();
  return dropped;
}

} // namespace stacknav

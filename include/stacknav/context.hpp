#ifndef STACKNAV_CONTEXT_HPP
#define STACKNAV_CONTEXT_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace stacknav {

// Host-managed strong reference.
template <typename T> using Entity = std::shared_ptr<T>;

// Non-owning handle to an entity. Lookups fail once the owner is gone.
template <typename T> class WeakEntity {
public:
  WeakEntity() = default;
  explicit WeakEntity(const Entity<T> &entity) : ref_(entity) {}

  Entity<T> upgrade() const { return ref_.lock(); }
  bool expired() const { return ref_.expired(); }

private:
  std::weak_ptr<T> ref_;
};

template <typename T> WeakEntity<T> downgrade(const Entity<T> &entity) {
  return WeakEntity<T>(entity);
}

// Mutation context handed to every state-changing call. Holding one is the
// permission to mutate shared application state; every mutation must end
// with notify() so the host schedules a redraw.
//
// Not thread-safe: owned and used by the UI thread only.
class Context {
public:
  using WakeHandler = std::function<void()>;

  Context() = default;
  explicit Context(WakeHandler wake) : wake_(std::move(wake)) {}

  Context(const Context &) = delete;
  Context &operator=(const Context &) = delete;

  // Called on every notify(), e.g. to unblock an event loop waiting for input.
  void setWakeHandler(WakeHandler wake) { wake_ = std::move(wake); }

  template <typename T> Entity<std::decay_t<T>> create(T &&value) {
    ++created_;
    return std::make_shared<std::decay_t<T>>(std::forward<T>(value));
  }

  void notify();

  // Returns the pending flag and clears it.
  bool takeNotify();
  bool pendingNotify() const { return pending_; }
  std::uint64_t notifyCount() const { return notifyCount_; }
  std::uint64_t createdCount() const { return created_; }

  // Keep a released entity alive until the next collect().
  void defer(std::shared_ptr<void> entity);
  std::size_t deferredCount() const { return deferred_.size(); }

  // Collection point: drop everything deferred since the last call.
  // Returns the number of references dropped.
  std::size_t collect();

private:
  WakeHandler wake_;
  bool pending_ = false;
  std::uint64_t notifyCount_ = 0;
  std::uint64_t created_ = 0;
  std::vector<std::shared_ptr<void>> deferred_;
};

} // namespace stacknav

#endif // STACKNAV_CONTEXT_HPP

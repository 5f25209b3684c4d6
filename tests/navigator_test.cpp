#include "stacknav/navigator.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

using stacknav::Context;
using stacknav::Entity;
using stacknav::Navigator;
using stacknav::Screen;

namespace {

// Records lifecycle events as "enter:<id>" / "exit:<id>".
class TestScreen : public Screen {
public:
  explicit TestScreen(std::string id, std::vector<std::string> *events = nullptr)
      : id_(std::move(id)), events_(events) {}

  std::string id() const override { return id_; }
  void render(Context &) override { ++renders_; }
  void onEnter(Context &) override { record("enter"); }
  void onExit(Context &) override { record("exit"); }

  int renders() const { return renders_; }

private:
  void record(const char *what) {
    if (events_)
      events_->push_back(std::string(what) + ":" + id_);
  }

  std::string id_;
  std::vector<std::string> *events_;
  int renders_ = 0;
};

std::string currentId(const Navigator &nav) {
  Screen *screen = nav.current();
  return screen ? screen->id() : std::string();
}

} // namespace

TEST(NavigatorTest, NewNavigatorIsEmpty) {
  Navigator nav;
  EXPECT_EQ(nav.depth(), 0u);
  EXPECT_TRUE(nav.empty());
  EXPECT_EQ(nav.current(), nullptr);
  EXPECT_EQ(nav.currentEntity(), nullptr);
  EXPECT_FALSE(nav.canGoBack());
  EXPECT_TRUE(nav.history().empty());
}

TEST(NavigatorTest, PushSingleScreen) {
  Context cx;
  Navigator nav;
  nav.push(TestScreen("home"), cx);

  EXPECT_EQ(nav.depth(), 1u);
  EXPECT_EQ(currentId(nav), "home");
  EXPECT_FALSE(nav.canGoBack());
}

TEST(NavigatorTest, PushThenPopReturnsToPrevious) {
  Context cx;
  Navigator nav;
  nav.push(TestScreen("home"), cx);
  nav.push(TestScreen("settings"), cx);

  EXPECT_EQ(nav.depth(), 2u);
  EXPECT_EQ(currentId(nav), "settings");
  EXPECT_TRUE(nav.canGoBack());

  EXPECT_TRUE(nav.pop(cx));
  EXPECT_EQ(nav.depth(), 1u);
  EXPECT_EQ(currentId(nav), "home");
  EXPECT_FALSE(nav.canGoBack());
}

TEST(NavigatorTest, PopLastScreenLeavesStackEmpty) {
  Context cx;
  Navigator nav;
  nav.push(TestScreen("home"), cx);

  EXPECT_TRUE(nav.pop(cx));
  EXPECT_TRUE(nav.empty());
  EXPECT_EQ(nav.current(), nullptr);
}

TEST(NavigatorTest, PopOnEmptyIsRepeatableNoOp) {
  Context cx;
  Navigator nav;
  for (int i = 0; i < 5; ++i) {
    EXPECT_FALSE(nav.pop(cx));
    EXPECT_EQ(nav.depth(), 0u);
  }
  EXPECT_EQ(cx.notifyCount(), 0u);
  EXPECT_FALSE(cx.pendingNotify());
}

TEST(NavigatorTest, ReplaceKeepsDepth) {
  Context cx;
  Navigator nav;
  nav.push(TestScreen("home"), cx);
  nav.push(TestScreen("settings"), cx);

  EXPECT_TRUE(nav.replace(TestScreen("login"), cx));
  EXPECT_EQ(nav.depth(), 2u);
  EXPECT_EQ(currentId(nav), "login");
  EXPECT_EQ(nav.history(), (std::vector<std::string>{"home", "login"}));
}

TEST(NavigatorTest, ReplaceOnEmptyPushesAndReturnsFalse) {
  Context cx;
  Navigator nav;

  EXPECT_FALSE(nav.replace(TestScreen("login"), cx));
  EXPECT_EQ(nav.depth(), 1u);
  EXPECT_EQ(currentId(nav), "login");
  EXPECT_EQ(cx.notifyCount(), 1u);
}

TEST(NavigatorTest, ClearAndPushDropsHistory) {
  Context cx;
  Navigator nav;
  nav.push(TestScreen("home"), cx);
  nav.push(TestScreen("profile"), cx);
  nav.push(TestScreen("settings"), cx);

  nav.clearAndPush(TestScreen("login"), cx);
  EXPECT_EQ(nav.depth(), 1u);
  EXPECT_EQ(currentId(nav), "login");
  EXPECT_FALSE(nav.canGoBack());
  EXPECT_EQ(nav.history(), (std::vector<std::string>{"login"}));
}

TEST(NavigatorTest, ClearAndPushOnEmptyStack) {
  Context cx;
  Navigator nav;
  nav.clearAndPush(TestScreen("login"), cx);
  EXPECT_EQ(nav.depth(), 1u);
  EXPECT_EQ(currentId(nav), "login");
}

TEST(NavigatorTest, HistoryIsBottomToTop) {
  Context cx;
  Navigator nav;
  nav.push(TestScreen("a"), cx);
  nav.push(TestScreen("b"), cx);
  nav.push(TestScreen("c"), cx);
  EXPECT_EQ(nav.history(), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(NavigatorTest, DuplicateIdsAreAllowed) {
  Context cx;
  Navigator nav;
  nav.push(TestScreen("detail"), cx);
  nav.push(TestScreen("detail"), cx);
  EXPECT_EQ(nav.depth(), 2u);
  EXPECT_TRUE(nav.pop(cx));
  EXPECT_EQ(currentId(nav), "detail");
}

TEST(NavigatorTest, EachMutationNotifiesOnce) {
  Context cx;
  Navigator nav;

  nav.push(TestScreen("home"), cx);
  EXPECT_EQ(cx.notifyCount(), 1u);
  EXPECT_TRUE(cx.takeNotify());
  EXPECT_FALSE(cx.takeNotify());

  nav.push(TestScreen("settings"), cx);
  EXPECT_EQ(cx.notifyCount(), 2u);

  nav.replace(TestScreen("profile"), cx);
  EXPECT_EQ(cx.notifyCount(), 3u);

  nav.pop(cx);
  EXPECT_EQ(cx.notifyCount(), 4u);

  nav.clearAndPush(TestScreen("login"), cx);
  EXPECT_EQ(cx.notifyCount(), 5u);

  nav.pop(cx);
  nav.pop(cx);
  EXPECT_EQ(cx.notifyCount(), 6u);
}

TEST(NavigatorTest, WakeHandlerSeesFinalStack) {
  Navigator nav;
  std::vector<std::string> seen;
  Context cx([&]() { seen.push_back(currentId(nav)); });

  nav.push(TestScreen("home"), cx);
  nav.push(TestScreen("settings"), cx);
  nav.replace(TestScreen("login"), cx);
  nav.pop(cx);
  nav.clearAndPush(TestScreen("profile"), cx);

  EXPECT_EQ(seen, (std::vector<std::string>{"home", "settings", "login",
                                            "home", "profile"}));
}

TEST(NavigatorTest, LifecycleHooksFireInOrder) {
  Context cx;
  Navigator nav;
  std::vector<std::string> events;

  nav.push(TestScreen("home", &events), cx);
  nav.push(TestScreen("settings", &events), cx);
  nav.replace(TestScreen("login", &events), cx);
  nav.pop(cx);
  nav.push(TestScreen("profile", &events), cx);
  nav.clearAndPush(TestScreen("root", &events), cx);

  EXPECT_EQ(events, (std::vector<std::string>{
                        "enter:home", "enter:settings", "exit:settings",
                        "enter:login", "exit:login", "enter:profile",
                        "exit:profile", "exit:home", "enter:root"}));
}

TEST(NavigatorTest, PoppedScreenLivesUntilCollect) {
  Context cx;
  Navigator nav;
  nav.push(TestScreen("home"), cx);
  nav.push(TestScreen("settings"), cx);

  std::weak_ptr<Screen> popped = nav.currentEntity();
  ASSERT_FALSE(popped.expired());

  EXPECT_TRUE(nav.pop(cx));
  EXPECT_FALSE(popped.expired());
  EXPECT_EQ(cx.deferredCount(), 1u);

  EXPECT_EQ(cx.collect(), 1u);
  EXPECT_TRUE(popped.expired());
}

TEST(NavigatorTest, OutsideReferenceOutlivesCollect) {
  Context cx;
  Navigator nav;
  nav.push(TestScreen("home"), cx);

  Entity<Screen> held = nav.currentEntity();
  nav.clearAndPush(TestScreen("login"), cx);
  cx.collect();

  ASSERT_NE(held, nullptr);
  EXPECT_EQ(held->id(), "home");
}

TEST(NavigatorTest, ScreenCanPopItselfWhileRendering) {
  struct SelfPopping : Screen {
    Navigator *nav;
    explicit SelfPopping(Navigator *n) : nav(n) {}
    std::string id() const override { return "self"; }
    void render(Context &cx) override {
      nav->pop(cx);
      // Still valid: the navigator deferred our release.
      rendered = id() == "self";
    }
    bool rendered = false;
  };

  Context cx;
  Navigator nav;
  nav.push(TestScreen("home"), cx);
  nav.push(SelfPopping(&nav), cx);

  Screen *screen = nav.current();
  screen->render(cx);
  EXPECT_TRUE(static_cast<SelfPopping *>(screen)->rendered);
  EXPECT_EQ(currentId(nav), "home");
  cx.collect();
}

TEST(NavigatorTest, DestroyingNavigatorReleasesScreens) {
  Context cx;
  std::weak_ptr<Screen> observed;
  {
    Navigator nav;
    nav.push(TestScreen("home"), cx);
    observed = nav.currentEntity();
  }
  EXPECT_TRUE(observed.expired());
}

TEST(NavigatorTest, CurrentReturnsRenderableScreen) {
  Context cx;
  Navigator nav;
  nav.push(TestScreen("home"), cx);

  nav.current()->render(cx);
  nav.current()->render(cx);
  EXPECT_EQ(static_cast<TestScreen *>(nav.current())->renders(), 2);
}

TEST(NavigatorTest, DepthMatchesOperationCount) {
  std::mt19937 rng(1234);
  std::uniform_int_distribution<int> op(0, 3);

  Context cx;
  Navigator nav;
  std::vector<std::string> model;

  for (int i = 0; i < 500; ++i) {
    std::string id = "s" + std::to_string(i);
    switch (op(rng)) {
    case 0:
      nav.push(TestScreen(id), cx);
      model.push_back(id);
      break;
    case 1:
      EXPECT_EQ(nav.pop(cx), !model.empty());
      if (!model.empty())
        model.pop_back();
      break;
    case 2:
      EXPECT_EQ(nav.replace(TestScreen(id), cx), !model.empty());
      if (!model.empty())
        model.back() = id;
      else
        model.push_back(id);
      break;
    case 3:
      if (i % 7 == 0) {
        nav.clearAndPush(TestScreen(id), cx);
        model.assign(1, id);
      }
      break;
    }

    ASSERT_EQ(nav.depth(), model.size());
    ASSERT_EQ(nav.history(), model);
    ASSERT_EQ(nav.canGoBack(), model.size() > 1);
    ASSERT_EQ(currentId(nav), model.empty() ? std::string() : model.back());
    cx.collect();
  }
}

TEST(NavigatorTest, ClearGivesEveryRemainingScreenItsExitHook) {
  Context cx;
  Navigator nav;
  std::vector<std::string> events;
  nav.push(TestScreen("home", &events), cx);
  nav.push(TestScreen("settings", &events), cx);
  events.clear();
  std::uint64_t before = cx.notifyCount();

  std::weak_ptr<Screen> settings = nav.currentEntity();
  EXPECT_TRUE(nav.clear(cx));

  EXPECT_TRUE(nav.empty());
  EXPECT_EQ(events,
            (std::vector<std::string>{"exit:settings", "exit:home"}));
  EXPECT_EQ(cx.notifyCount(), before + 1);
  EXPECT_FALSE(settings.expired());
  cx.collect();
  EXPECT_TRUE(settings.expired());
}

TEST(NavigatorTest, ClearOnEmptyDoesNothing) {
  Context cx;
  Navigator nav;
  EXPECT_FALSE(nav.clear(cx));
  EXPECT_EQ(cx.notifyCount(), 0u);
}

namespace {

// Records the depth seen from onExit and pushes a follow-up screen once.
class ExitPushingScreen : public Screen {
public:
  ExitPushingScreen(Navigator *nav, std::vector<std::size_t> *depths)
      : nav_(nav), depths_(depths) {}

  std::string id() const override { return "exit-pushing"; }
  void render(Context &) override {}
  void onExit(Context &cx) override {
    depths_->push_back(nav_->depth());
    if (!pushed_) {
      pushed_ = true;
      nav_->push(TestScreen("pushed-on-exit"), cx);
    }
  }

private:
  Navigator *nav_;
  std::vector<std::size_t> *depths_;
  bool pushed_ = false;
};

} // namespace

TEST(NavigatorTest, ExitHooksDuringClearAndPushSeeDetachedStack) {
  Context cx;
  Navigator nav;
  std::vector<std::size_t> depths;
  nav.push(TestScreen("home"), cx);
  nav.push(ExitPushingScreen(&nav, &depths), cx);

  nav.clearAndPush(TestScreen("login"), cx);

  // The hook ran once, on an already emptied stack, and what it pushed
  // survives below the new root.
  EXPECT_EQ(depths, (std::vector<std::size_t>{0}));
  EXPECT_EQ(nav.history(),
            (std::vector<std::string>{"pushed-on-exit", "login"}));
  EXPECT_EQ(currentId(nav), "login");
  cx.collect();
}

#include "paneld/watch/file_watcher.hpp"

#include "paneld/core/runtime.hpp"

#include <memory>
#include <variant>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace paneld;

namespace {

constexpr auto kCooldown = std::chrono::milliseconds(200);

auto count_reloads(CommandReceiver& rx) -> std::size_t {
  std::size_t n = 0;
  while (auto cmd = rx.try_recv()) {
    if (std::holds_alternative<command::ReloadConfigAndCss>(*cmd)) {
      ++n;
    }
  }
  return n;
}

auto run_watcher(FileWatcher& watcher, CommandSender sink,
                 std::shared_ptr<test::BlockingQueue<Result<void>>> out)
    -> spawn_task {
  out->push(co_await watcher.run(std::move(sink)));
}

class FileWatcherTest : public ::testing::Test {
protected:
  void SetUp() override {
    rt_.start();
  }

  // Tests whose watcher is still running stop the runtime themselves, before
  // the watcher goes away.
  void TearDown() override {
    rt_.stop();
  }

  Runtime rt_{1};
  test::TempDir dir_;
};

}  // namespace

TEST(FileWatcherFilterTest, WidgetAndStylesheetFilesAreRelevant) {
  EXPECT_TRUE(FileWatcher::is_relevant_change("/cfg/panel.yuck"));
  EXPECT_TRUE(FileWatcher::is_relevant_change("/cfg/widgets/bar.yuck"));
  EXPECT_TRUE(FileWatcher::is_relevant_change("/cfg/panel.scss"));
}

TEST(FileWatcherFilterTest, OtherFilesAreIgnored) {
  EXPECT_FALSE(FileWatcher::is_relevant_change("/cfg/notes.txt"));
  EXPECT_FALSE(FileWatcher::is_relevant_change("/cfg/panel.yuck.swp"));
  EXPECT_FALSE(FileWatcher::is_relevant_change("/cfg/.panel.yuck~"));
  EXPECT_FALSE(FileWatcher::is_relevant_change("/cfg/daemon.yaml"));
  EXPECT_FALSE(FileWatcher::is_relevant_change("/cfg/yuck"));
}

TEST_F(FileWatcherTest, BurstOfChangesYieldsOneReload) {
  FileWatcher watcher(rt_, dir_.path(), kCooldown);
  auto [tx, rx] = make_channel<Command>();

  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(watcher.notify_change(dir_.path() / "panel.yuck", tx));
    ASSERT_TRUE(watcher.notify_change(dir_.path() / "panel.scss", tx));
  }

  EXPECT_EQ(count_reloads(rx), 1u);
  EXPECT_EQ(watcher.reloads_requested(), 1u);
  EXPECT_FALSE(watcher.gate().is_open());
}

TEST_F(FileWatcherTest, IrrelevantChangesNeverReload) {
  FileWatcher watcher(rt_, dir_.path(), kCooldown);
  auto [tx, rx] = make_channel<Command>();

  ASSERT_TRUE(watcher.notify_change(dir_.path() / "README.md", tx));
  ASSERT_TRUE(watcher.notify_change(dir_.path() / "panel.yuck.swp", tx));

  EXPECT_EQ(count_reloads(rx), 0u);
  EXPECT_TRUE(watcher.gate().is_open());
}

TEST_F(FileWatcherTest, NextWindowAllowsAnotherReload) {
  FileWatcher watcher(rt_, dir_.path(), kCooldown);
  auto [tx, rx] = make_channel<Command>();

  ASSERT_TRUE(watcher.notify_change(dir_.path() / "panel.yuck", tx));
  EXPECT_EQ(count_reloads(rx), 1u);

  ASSERT_TRUE(test::wait_until([&] { return watcher.gate().is_open(); }));
  ASSERT_TRUE(watcher.notify_change(dir_.path() / "panel.yuck", tx));
  EXPECT_EQ(count_reloads(rx), 1u);
  EXPECT_EQ(watcher.reloads_requested(), 2u);
}

TEST_F(FileWatcherTest, ClosedQueueIsReported) {
  FileWatcher watcher(rt_, dir_.path(), kCooldown);
  auto channel = make_channel<Command>();
  auto tx = std::move(channel.first);
  { auto rx = std::move(channel.second); }

  auto r = watcher.notify_change(dir_.path() / "panel.yuck", tx);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::ChannelClosed);
}

TEST_F(FileWatcherTest, MissingDirectoryFailsSetup) {
  FileWatcher watcher(rt_, dir_.path() / "does-not-exist", kCooldown);
  auto [tx, rx] = make_channel<Command>();

  auto results = std::make_shared<test::BlockingQueue<Result<void>>>();
  rt_.spawn(run_watcher(watcher, tx, results));

  auto r = results->try_pop_for(std::chrono::seconds(2));
  ASSERT_TRUE(r.has_value());
  ASSERT_FALSE(r->has_value());
  EXPECT_EQ(r->error(), Error::WatchSetupFailed);
}

TEST_F(FileWatcherTest, EditingWidgetFileRequestsReload) {
  dir_.write("panel.yuck", "(defwindow bar)\n");
  FileWatcher watcher(rt_, dir_.path(), kCooldown);
  auto [tx, rx] = make_channel<Command>();

  auto results = std::make_shared<test::BlockingQueue<Result<void>>>();
  rt_.spawn(run_watcher(watcher, tx, results));
  test::sleep_ms(std::chrono::milliseconds(50));

  dir_.write("panel.yuck", "(defwindow bar :monitor 0)\n");

  std::size_t reloads = 0;
  EXPECT_TRUE(test::wait_until([&] {
    reloads += count_reloads(rx);
    return reloads > 0;
  }));
  EXPECT_EQ(reloads, 1u);
  EXPECT_EQ(results->size(), 0u);
  rt_.stop();
}

TEST_F(FileWatcherTest, ChangesInNewSubdirectoryAreSeen) {
  FileWatcher watcher(rt_, dir_.path(), kCooldown);
  auto [tx, rx] = make_channel<Command>();

  auto results = std::make_shared<test::BlockingQueue<Result<void>>>();
  rt_.spawn(run_watcher(watcher, tx, results));
  test::sleep_ms(std::chrono::milliseconds(50));

  std::filesystem::create_directory(dir_.path() / "widgets");
  test::sleep_ms(std::chrono::milliseconds(50));
  dir_.write("widgets/clock.yuck", "(defwidget clock [] \"12:00\")\n");

  std::size_t reloads = 0;
  EXPECT_TRUE(test::wait_until([&] {
    reloads += count_reloads(rx);
    return reloads > 0;
  }));
  rt_.stop();
}

TEST_F(FileWatcherTest, DroppedReceiverEndsRun) {
  FileWatcher watcher(rt_, dir_.path(), kCooldown);
  auto channel = make_channel<Command>();

  auto results = std::make_shared<test::BlockingQueue<Result<void>>>();
  rt_.spawn(run_watcher(watcher, std::move(channel.first), results));
  test::sleep_ms(std::chrono::milliseconds(50));

  { auto rx = std::move(channel.second); }
  dir_.write("panel.scss", "* { all: unset; }\n");

  auto r = results->try_pop_for(std::chrono::seconds(2));
  ASSERT_TRUE(r.has_value());
  ASSERT_FALSE(r->has_value());
  EXPECT_EQ(r->error(), Error::ChannelClosed);
}

TEST_F(FileWatcherTest, ReloadResponseIsAwaited) {
  FileWatcher watcher(rt_, dir_.path(), kCooldown);
  auto [tx, rx] = make_channel<Command>();

  ASSERT_TRUE(watcher.notify_change(dir_.path() / "panel.scss", tx));

  auto cmd = rx.try_recv();
  ASSERT_TRUE(cmd.has_value());
  auto* reload = std::get_if<command::ReloadConfigAndCss>(&*cmd);
  ASSERT_NE(reload, nullptr);
  EXPECT_FALSE(reload->response.is_closed());
  EXPECT_TRUE(reload->response.send(DaemonResponse::success()));
}

TEST_F(FileWatcherTest, InotifyDescriptorIsClosedWithWatcher) {
  dir_.write("panel.yuck", "(defwindow bar)\n");
  auto before = test::open_fd_count();
  {
    FileWatcher watcher(rt_, dir_.path(), kCooldown);
    auto [tx, rx] = make_channel<Command>();
    auto results = std::make_shared<test::BlockingQueue<Result<void>>>();
    rt_.spawn(run_watcher(watcher, tx, results));

    EXPECT_TRUE(test::wait_until(
        [&] { return test::open_fd_count() == before + 1; }));
    rt_.stop();
  }
  EXPECT_EQ(test::open_fd_count(), before);
}

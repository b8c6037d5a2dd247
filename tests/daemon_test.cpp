#include "paneld/util/daemon.hpp"

#include "paneld/util/unique_fd.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <set>
#include <string>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace paneld;

namespace {

struct Pipe {
  UniqueFd read_end;
  UniqueFd write_end;
};

auto make_pipe() -> Pipe {
  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) != 0) {
    return {};
  }
  return {UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

auto drain(int fd) -> std::string {
  std::string out;
  std::array<char, 256> buf{};
  while (true) {
    auto n = ::read(fd, buf.data(), buf.size());
    if (n <= 0) {
      break;
    }
    out.append(buf.data(), static_cast<std::size_t>(n));
  }
  return out;
}

auto write_str(int fd, std::string_view s) -> bool {
  return ::write(fd, s.data(), s.size()) == static_cast<ssize_t>(s.size());
}

}  // namespace

TEST(DaemonTest, RedirectsOnlyTerminalStreams) {
  auto log = make_pipe();
  auto out = make_pipe();
  auto err = make_pipe();
  ASSERT_TRUE(log.read_end && out.read_end && err.read_end);

  // Duplicates stand in for stdout/stderr so the real ones are left alone.
  UniqueFd fake_stdout{::dup(out.write_end.get())};
  UniqueFd fake_stderr{::dup(err.write_end.get())};
  ASSERT_TRUE(fake_stdout && fake_stderr);

  std::set<int> terminals{fake_stdout.get()};
  std::array fds{fake_stdout.get(), fake_stderr.get()};
  auto r = redirect_terminal_streams(log.write_end.get(), fds, [&](int fd) {
    return terminals.contains(fd);
  });
  ASSERT_TRUE(r.has_value());

  ASSERT_TRUE(write_str(fake_stdout.get(), "to-log"));
  ASSERT_TRUE(write_str(fake_stderr.get(), "to-stderr"));

  EXPECT_EQ(drain(log.read_end.get()), "to-log");
  EXPECT_EQ(drain(out.read_end.get()), "");
  EXPECT_EQ(drain(err.read_end.get()), "to-stderr");
}

TEST(DaemonTest, NothingRedirectedWithoutTerminals) {
  auto log = make_pipe();
  auto out = make_pipe();
  ASSERT_TRUE(log.read_end && out.read_end);

  UniqueFd fake_stdout{::dup(out.write_end.get())};
  std::array fds{fake_stdout.get()};
  auto r = redirect_terminal_streams(log.write_end.get(), fds,
                                     [](int) { return false; });
  ASSERT_TRUE(r.has_value());

  ASSERT_TRUE(write_str(fake_stdout.get(), "stays"));
  EXPECT_EQ(drain(out.read_end.get()), "stays");
  EXPECT_EQ(drain(log.read_end.get()), "");
}

TEST(DaemonTest, BadLogDescriptorFails) {
  auto out = make_pipe();
  UniqueFd fake_stdout{::dup(out.write_end.get())};
  std::array fds{fake_stdout.get()};
  auto r = redirect_terminal_streams(-1, fds, [](int) { return true; });
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::RedirectFailed);
}

TEST(DaemonTest, PipesAreNotTerminals) {
  auto log = make_pipe();
  auto out = make_pipe();
  UniqueFd fake_stdout{::dup(out.write_end.get())};
  std::array fds{fake_stdout.get()};

  ASSERT_TRUE(redirect_terminal_streams(log.write_end.get(), fds).has_value());
  ASSERT_TRUE(write_str(fake_stdout.get(), "pipe"));
  EXPECT_EQ(drain(out.read_end.get()), "pipe");
}

#pragma once

#include <unistd.h>

#include <utility>

namespace paneld {

/// RAII owner of a file descriptor; closes it on destruction.
class UniqueFd {
public:
  UniqueFd() noexcept = default;
  explicit UniqueFd(int fd) noexcept : fd_(fd) {}

  UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

  auto operator=(UniqueFd&& other) noexcept -> UniqueFd& {
    if (this != &other) {
      reset(std::exchange(other.fd_, -1));
    }
    return *this;
  }

  UniqueFd(const UniqueFd&) = delete;
  auto operator=(const UniqueFd&) -> UniqueFd& = delete;

  ~UniqueFd() { reset(); }

  [[nodiscard]] auto get() const noexcept -> int { return fd_; }
  [[nodiscard]] auto is_open() const noexcept -> bool { return fd_ >= 0; }
  [[nodiscard]] explicit operator bool() const noexcept { return is_open(); }

  /// Release ownership and return raw fd
  [[nodiscard]] auto release() noexcept -> int {
    return std::exchange(fd_, -1);
  }

  auto reset(int fd = -1) noexcept -> void {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_{-1};
};

}  // namespace paneld

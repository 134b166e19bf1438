#include "initbench/core/FileDescriptor.hpp"

#include <array>
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

namespace initbench::core {

FileDescriptor::FileDescriptor(int fd) noexcept
    : fd_(fd) {}

FileDescriptor::~FileDescriptor() {
  reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.fd_) {
  other.fd_ = -1;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
  if (this != &other) {
    reset(other.fd_);
    other.fd_ = -1;
  }
  return *this;
}

int FileDescriptor::get() const noexcept {
  return fd_;
}

bool FileDescriptor::valid() const noexcept {
  return fd_ >= 0;
}

int FileDescriptor::release() noexcept {
  int old_fd = fd_;
  fd_        = -1;
  return old_fd;
}

void FileDescriptor::reset(int fd) noexcept {
  if (fd_ != -1) {
    close(fd_);
  }
  fd_ = fd;
}

auto FileDescriptor::write_all(std::string_view data) const -> Result<void> {
  while (!data.empty()) {
    ssize_t written = ::write(fd_, data.data(), data.size());
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(errno_error("write", errno));
    }
    data.remove_prefix(static_cast<size_t>(written));
  }
  return {};
}

auto make_pipe() -> Result<std::pair<FileDescriptor, FileDescriptor>> {
  std::array<int, 2> fds{};
  if (pipe2(fds.data(), O_CLOEXEC) == -1) {
    return std::unexpected(errno_error("pipe2", errno));
  }
  return std::make_pair(FileDescriptor(fds[0]), FileDescriptor(fds[1]));
}

} // namespace initbench::core

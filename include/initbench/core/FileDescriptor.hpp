#pragma once

#include "initbench/core/Error.hpp"

#include <string_view>
#include <utility>

namespace initbench::core {

class FileDescriptor {
  int fd_ = -1;

public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) noexcept;
  ~FileDescriptor();
  FileDescriptor(FileDescriptor const&)            = delete;
  FileDescriptor& operator=(FileDescriptor const&) = delete;
  FileDescriptor(FileDescriptor&& other) noexcept;
  FileDescriptor& operator=(FileDescriptor&& other) noexcept;

  [[nodiscard]] int  get() const noexcept;
  [[nodiscard]] bool valid() const noexcept;
  int                release() noexcept;
  void               reset(int fd = -1) noexcept;

  // Writes every byte, retrying on EINTR and short writes.
  [[nodiscard]] auto write_all(std::string_view data) const -> Result<void>;
};

// Close-on-exec pipe as (read end, write end).
[[nodiscard]] auto make_pipe() -> Result<std::pair<FileDescriptor, FileDescriptor>>;

} // namespace initbench::core

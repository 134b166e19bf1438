#pragma once

#include "initbench/core/Error.hpp"
#include "initbench/core/FileDescriptor.hpp"

#include <filesystem>
#include <string_view>

namespace initbench::core {

// Private temporary file, unlinked when the handle goes out of scope.
class TempFile {
  std::filesystem::path path_;
  FileDescriptor        fd_;

  TempFile(std::filesystem::path path, FileDescriptor fd) noexcept;

public:
  // Creates the file with mkstemp (O_EXCL, mode 0600) inside `dir`.
  [[nodiscard]] static auto create(std::filesystem::path const& dir, std::string_view suffix = "")
      -> Result<TempFile>;
  // Same, inside the system temporary directory ($TMPDIR or /tmp).
  [[nodiscard]] static auto create_in_temp_dir(std::string_view suffix = "") -> Result<TempFile>;

  ~TempFile();
  TempFile(TempFile const&)            = delete;
  TempFile& operator=(TempFile const&) = delete;
  TempFile(TempFile&& other) noexcept;
  TempFile& operator=(TempFile&& other) noexcept;

  [[nodiscard]] auto path() const noexcept -> std::filesystem::path const&;
  [[nodiscard]] auto write_all(std::string_view data) const -> Result<void>;

private:
  void remove();
};

} // namespace initbench::core

#include "initbench/core/TempFile.hpp"
#include "initbench/core/Log.hpp"

#include <cerrno>
#include <cstdio>
#include <exception>
#include <cstdlib>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace initbench::core {

TempFile::TempFile(std::filesystem::path path, FileDescriptor fd) noexcept
    : path_(std::move(path)), fd_(std::move(fd)) {}

auto TempFile::create(std::filesystem::path const& dir, std::string_view suffix) -> Result<TempFile> {
  std::string       pattern = (dir / "initbench.XXXXXX").string();
  pattern.append(suffix);
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');

  int fd = mkstemps(buffer.data(), static_cast<int>(suffix.size()));
  if (fd == -1) {
    return std::unexpected(errno_error(fmt::format("mkstemps({})", pattern), errno));
  }
  std::filesystem::path path{buffer.data()};
  log::trace("temp file: created {}", path.string());
  return TempFile{std::move(path), FileDescriptor{fd}};
}

auto TempFile::create_in_temp_dir(std::string_view suffix) -> Result<TempFile> {
  std::error_code ec;
  auto            dir = std::filesystem::temp_directory_path(ec);
  if (ec) {
    return fail("could not find the temporary directory: {}", ec.message());
  }
  return create(dir, suffix);
}

TempFile::~TempFile() {
  remove();
}

TempFile::TempFile(TempFile&& other) noexcept
    : path_(std::move(other.path_)), fd_(std::move(other.fd_)) {
  other.path_.clear();
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    fd_   = std::move(other.fd_);
    other.path_.clear();
  }
  return *this;
}

auto TempFile::path() const noexcept -> std::filesystem::path const& {
  return path_;
}

auto TempFile::write_all(std::string_view data) const -> Result<void> {
  if (auto result = fd_.write_all(data); !result) {
    return std::unexpected(result.error().with_context(fmt::format("while writing to {}", path_.string())));
  }
  return {};
}

void TempFile::remove() {
  fd_.reset();
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    // Runs from the destructor, where a throwing stderr write would terminate.
    try {
      log::warn("temp file: could not remove {}: {}", path_.string(), ec.message());
    } catch (std::exception const& e) {
      std::fprintf(stderr, "temp file: could not remove %s (%s)\n", path_.c_str(), e.what());
    }
  }
  path_.clear();
}

} // namespace initbench::core

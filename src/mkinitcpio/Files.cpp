#include "initbench/mkinitcpio/Files.hpp"
#include "initbench/core/Log.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace initbench::mkinitcpio {

namespace fs = std::filesystem;

auto create_dir(fs::path const& path) -> Result<void> {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    core::log::warn("create_dir: at={}, error={}", path.string(), ec.message());
    return core::fail("could not create {}: {}", path.string(), ec.message());
  }
  core::log::debug("create_dir: at={}", path.string());
  return {};
}

auto cleanup(fs::path const& path) -> Result<void> {
  std::error_code ec;
  auto            status = fs::symlink_status(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    core::log::warn("cleanup: path={}, error={}", path.string(), ec.message());
    return core::fail("could not inspect {}: {}", path.string(), ec.message());
  }
  if (!fs::exists(status)) {
    core::log::debug("cleanup: path={}, missing", path.string());
    return {};
  }

  core::log::debug("cleanup: path={}, is_dir={}", path.string(), fs::is_directory(status));
  fs::remove_all(path, ec);
  if (ec) {
    core::log::warn("cleanup: path={}, error={}", path.string(), ec.message());
    return core::fail("could not remove {}: {}", path.string(), ec.message());
  }
  return {};
}

auto read_file(fs::path const& path) -> Result<std::string> {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return core::fail("could not open {}", path.string());
  }
  std::string contents{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
  if (file.bad()) {
    return core::fail("could not read {}", path.string());
  }
  return contents;
}

auto write_file(fs::path const& path, std::string_view contents) -> Result<void> {
  if (path.has_parent_path()) {
    if (auto created = create_dir(path.parent_path()); !created) {
      return created;
    }
  }

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    return core::fail("could not open {} for writing", path.string());
  }
  file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  file.close();
  if (!file) {
    return core::fail("could not write {}", path.string());
  }
  core::log::trace("write_file: {} ({} bytes)", path.string(), contents.size());
  return {};
}

} // namespace initbench::mkinitcpio

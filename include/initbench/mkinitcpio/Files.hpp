#pragma once

#include "initbench/core/Error.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace initbench::mkinitcpio {

using core::Result;

// Recursive, an existing directory is fine.
[[nodiscard]] auto create_dir(std::filesystem::path const& path) -> Result<void>;

// Removes a file or a whole tree. A missing path is fine.
[[nodiscard]] auto cleanup(std::filesystem::path const& path) -> Result<void>;

[[nodiscard]] auto read_file(std::filesystem::path const& path) -> Result<std::string>;

// Replaces the file, creating its parent directory first.
[[nodiscard]] auto write_file(std::filesystem::path const& path, std::string_view contents) -> Result<void>;

} // namespace initbench::mkinitcpio

#pragma once

#include "initbench/core/Constants.hpp"
#include "initbench/core/Error.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace initbench::process {

using core::Result;

struct Output {
  int         status_ = 0; // raw waitpid status
  std::string stdout_;
  std::string stderr_;

  // Exit code when the process exited normally.
  [[nodiscard]] auto exit_code() const noexcept -> std::optional<int>;
  [[nodiscard]] auto term_signal() const noexcept -> std::optional<int>;
  [[nodiscard]] auto success() const noexcept -> bool;
  [[nodiscard]] auto describe_status() const -> std::string;
};

// A program run with an empty environment, a fixed working directory and all
// three standard streams piped.
class Command {
  std::string                program_;
  std::vector<std::string>   args_;
  std::filesystem::path      working_directory_ = core::DEFAULT_WORKDIR;
  std::optional<std::string> stdin_data_;

public:
  explicit Command(std::string program);

  auto arg(std::string arg) -> Command&;
  auto current_dir(std::filesystem::path dir) -> Command&;
  // Without stdin data the child reads from /dev/null.
  auto stdin_data(std::string data) -> Command&;

  [[nodiscard]] auto program() const noexcept -> std::string const&;
  [[nodiscard]] auto args() const noexcept -> std::vector<std::string> const&;
  [[nodiscard]] auto working_directory() const noexcept -> std::filesystem::path const&;

  // Spawns, feeds stdin while draining stdout/stderr, then waits. Blocks until the
  // child exits; there is no timeout.
  [[nodiscard]] auto output() const -> Result<Output>;
};

// Failure message for a subprocess, in one of four shapes depending on whether an
// exit code and a non-blank stderr are available.
[[nodiscard]] auto failure_message(std::string_view name, std::optional<int> exit_code, std::string_view error_text)
    -> std::string;

// Turns a failed run into an Error and logs stderr lines of a successful one as
// warnings (and stdout lines as info when `show_stdout`). Returns stdout.
[[nodiscard]] auto check(std::string_view name, Output output, bool show_stdout) -> Result<std::string>;

} // namespace initbench::process

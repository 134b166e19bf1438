#include "initbench/process/Command.hpp"
#include "initbench/core/FileDescriptor.hpp"
#include "initbench/core/Log.hpp"
#include "initbench/core/Strings.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

namespace initbench::process {

namespace {

constexpr size_t READ_BUFFER_SIZE = 8192;

class SpawnFileActions {
  posix_spawn_file_actions_t actions_{};
  bool                       initialized_ = false;

public:
  SpawnFileActions() = default;
  ~SpawnFileActions() {
    if (initialized_) {
      posix_spawn_file_actions_destroy(&actions_);
    }
  }
  SpawnFileActions(SpawnFileActions const&)            = delete;
  SpawnFileActions& operator=(SpawnFileActions const&) = delete;
  SpawnFileActions(SpawnFileActions&&)                 = delete;
  SpawnFileActions& operator=(SpawnFileActions&&)      = delete;

  auto init() -> Result<void> {
    if (int err = posix_spawn_file_actions_init(&actions_)) {
      return std::unexpected(core::errno_error("posix_spawn_file_actions_init", err));
    }
    initialized_ = true;
    return {};
  }

  auto dup2(int fd, int target) -> Result<void> {
    if (int err = posix_spawn_file_actions_adddup2(&actions_, fd, target)) {
      return std::unexpected(core::errno_error("posix_spawn_file_actions_adddup2", err));
    }
    return {};
  }

  auto open(int target, char const* path, int flags) -> Result<void> {
    if (int err = posix_spawn_file_actions_addopen(&actions_, target, path, flags, 0)) {
      return std::unexpected(core::errno_error("posix_spawn_file_actions_addopen", err));
    }
    return {};
  }

  auto chdir(std::filesystem::path const& dir) -> Result<void> {
    if (int err = posix_spawn_file_actions_addchdir_np(&actions_, dir.c_str())) {
      return std::unexpected(core::errno_error("posix_spawn_file_actions_addchdir_np", err));
    }
    return {};
  }

  [[nodiscard]] auto get() const noexcept -> posix_spawn_file_actions_t const* {
    return &actions_;
  }
};

class SpawnAttributes {
  posix_spawnattr_t attrs_{};
  bool              initialized_ = false;

public:
  SpawnAttributes() = default;
  ~SpawnAttributes() {
    if (initialized_) {
      posix_spawnattr_destroy(&attrs_);
    }
  }
  SpawnAttributes(SpawnAttributes const&)            = delete;
  SpawnAttributes& operator=(SpawnAttributes const&) = delete;
  SpawnAttributes(SpawnAttributes&&)                 = delete;
  SpawnAttributes& operator=(SpawnAttributes&&)      = delete;

  // The parent ignores SIGPIPE; the child gets the default disposition back.
  auto init() -> Result<void> {
    if (int err = posix_spawnattr_init(&attrs_)) {
      return std::unexpected(core::errno_error("posix_spawnattr_init", err));
    }
    initialized_ = true;

    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGPIPE);
    if (int err = posix_spawnattr_setsigdefault(&attrs_, &defaults)) {
      return std::unexpected(core::errno_error("posix_spawnattr_setsigdefault", err));
    }
    if (int err = posix_spawnattr_setflags(&attrs_, POSIX_SPAWN_SETSIGDEF)) {
      return std::unexpected(core::errno_error("posix_spawnattr_setflags", err));
    }
    return {};
  }

  [[nodiscard]] auto get() const noexcept -> posix_spawnattr_t const* {
    return &attrs_;
  }
};

void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

auto set_nonblocking(int fd) -> Result<void> {
  int flags = fcntl(fd, F_GETFL);
  if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    return std::unexpected(core::errno_error("fcntl(O_NONBLOCK)", errno));
  }
  return {};
}

// Reads once from `fd` into `sink`. Returns false at end of file.
auto drain_once(core::FileDescriptor const& fd, std::string& sink) -> Result<bool> {
  std::array<char, READ_BUFFER_SIZE> buffer{};
  while (true) {
    ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(core::errno_error("read", errno));
    }
    sink.append(buffer.data(), static_cast<size_t>(n));
    return n > 0;
  }
}

auto wait_for(pid_t pid) -> Result<int> {
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return std::unexpected(core::errno_error("waitpid", errno));
    }
  }
  return status;
}

// Pumps stdin data into the child and collects both output streams until EOF.
auto communicate(
    core::FileDescriptor stdin_fd,
    core::FileDescriptor stdout_fd,
    core::FileDescriptor stderr_fd,
    std::string_view     input,
    Output&              output
) -> Result<void> {
  if (stdin_fd.valid()) {
    if (auto result = set_nonblocking(stdin_fd.get()); !result) {
      return result;
    }
  }

  while (stdin_fd.valid() || stdout_fd.valid() || stderr_fd.valid()) {
    std::array<pollfd, 3> fds{};
    nfds_t                count = 0;
    if (stdin_fd.valid()) {
      fds[count++] = pollfd{stdin_fd.get(), POLLOUT, 0};
    }
    if (stdout_fd.valid()) {
      fds[count++] = pollfd{stdout_fd.get(), POLLIN, 0};
    }
    if (stderr_fd.valid()) {
      fds[count++] = pollfd{stderr_fd.get(), POLLIN, 0};
    }

    if (poll(fds.data(), count, -1) == -1) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(core::errno_error("poll", errno));
    }

    for (nfds_t i = 0; i < count; ++i) {
      auto const& entry = fds[i];
      if (entry.revents == 0) {
        continue;
      }

      if (entry.fd == stdin_fd.get()) {
        if ((entry.revents & (POLLERR | POLLHUP)) != 0) {
          stdin_fd.reset();
          continue;
        }
        ssize_t written = ::write(stdin_fd.get(), input.data(), input.size());
        if (written < 0) {
          if (errno == EAGAIN || errno == EINTR) {
            continue;
          }
          if (errno != EPIPE) {
            return std::unexpected(core::errno_error("write", errno));
          }
          core::log::debug("command: child closed stdin with {} bytes left", input.size());
          stdin_fd.reset();
          continue;
        }
        input.remove_prefix(static_cast<size_t>(written));
        if (input.empty()) {
          stdin_fd.reset();
        }
        continue;
      }

      auto& fd   = entry.fd == stdout_fd.get() ? stdout_fd : stderr_fd;
      auto& sink = entry.fd == stdout_fd.get() ? output.stdout_ : output.stderr_;
      auto  more = drain_once(fd, sink);
      if (!more) {
        return std::unexpected(more.error());
      }
      if (!*more) {
        fd.reset();
      }
    }
  }
  return {};
}

} // namespace

auto Output::exit_code() const noexcept -> std::optional<int> {
  if (WIFEXITED(status_)) {
    return WEXITSTATUS(status_);
  }
  return std::nullopt;
}

auto Output::term_signal() const noexcept -> std::optional<int> {
  if (WIFSIGNALED(status_)) {
    return WTERMSIG(status_);
  }
  return std::nullopt;
}

auto Output::success() const noexcept -> bool {
  return exit_code() == 0;
}

auto Output::describe_status() const -> std::string {
  if (auto code = exit_code()) {
    return fmt::format("exit status: {}", *code);
  }
  if (auto sig = term_signal()) {
    return fmt::format("signal: {} ({})", *sig, strsignal(*sig));
  }
  return fmt::format("wait status: {:#x}", status_);
}

Command::Command(std::string program)
    : program_(std::move(program)) {}

auto Command::arg(std::string arg) -> Command& {
  args_.push_back(std::move(arg));
  return *this;
}

auto Command::current_dir(std::filesystem::path dir) -> Command& {
  working_directory_ = std::move(dir);
  return *this;
}

auto Command::stdin_data(std::string data) -> Command& {
  stdin_data_ = std::move(data);
  return *this;
}

auto Command::program() const noexcept -> std::string const& {
  return program_;
}

auto Command::args() const noexcept -> std::vector<std::string> const& {
  return args_;
}

auto Command::working_directory() const noexcept -> std::filesystem::path const& {
  return working_directory_;
}

auto Command::output() const -> Result<Output> {
  ignore_sigpipe();

  core::FileDescriptor child_stdin;
  core::FileDescriptor parent_stdin;
  if (stdin_data_) {
    auto stdin_pipe = core::make_pipe();
    if (!stdin_pipe) {
      return std::unexpected(stdin_pipe.error());
    }
    child_stdin  = std::move(stdin_pipe->first);
    parent_stdin = std::move(stdin_pipe->second);
  }
  auto stdout_pipe = core::make_pipe();
  if (!stdout_pipe) {
    return std::unexpected(stdout_pipe.error());
  }
  auto stderr_pipe = core::make_pipe();
  if (!stderr_pipe) {
    return std::unexpected(stderr_pipe.error());
  }

  SpawnFileActions actions;
  SpawnAttributes  attrs;
  if (auto result = actions.init(); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = attrs.init(); !result) {
    return std::unexpected(result.error());
  }
  auto stdin_action = child_stdin.valid() ? actions.dup2(child_stdin.get(), STDIN_FILENO)
                                          : actions.open(STDIN_FILENO, "/dev/null", O_RDONLY);
  if (!stdin_action) {
    return std::unexpected(stdin_action.error());
  }
  if (auto result = actions.dup2(stdout_pipe->second.get(), STDOUT_FILENO); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = actions.dup2(stderr_pipe->second.get(), STDERR_FILENO); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = actions.chdir(working_directory_); !result) {
    return std::unexpected(result.error());
  }

  std::vector<char*> argv;
  argv.reserve(args_.size() + 2);
  argv.push_back(const_cast<char*>(program_.c_str()));
  for (auto const& arg : args_) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);
  std::array<char*, 1> envp{nullptr};

  pid_t pid = -1;
  if (int err = posix_spawnp(&pid, program_.c_str(), actions.get(), attrs.get(), argv.data(), envp.data())) {
    return std::unexpected(core::errno_error(fmt::format("could not spawn {}", program_), err));
  }
  core::log::trace("command: spawned {} (pid {}) at {}", program_, pid, working_directory_.string());

  child_stdin.reset();
  stdout_pipe->second.reset();
  stderr_pipe->second.reset();

  Output output;
  auto   io_result = communicate(
      std::move(parent_stdin),
      std::move(stdout_pipe->first),
      std::move(stderr_pipe->first),
      stdin_data_ ? std::string_view{*stdin_data_} : std::string_view{},
      output
  );

  auto status = wait_for(pid);
  if (!io_result) {
    return std::unexpected(io_result.error());
  }
  if (!status) {
    return std::unexpected(status.error());
  }
  output.status_ = *status;
  return output;
}

auto failure_message(std::string_view name, std::optional<int> exit_code, std::string_view error_text) -> std::string {
  auto trimmed = core::trim(error_text);
  if (exit_code && !trimmed.empty()) {
    return fmt::format("{} failed (status = {}): {}", name, *exit_code, trimmed);
  }
  if (exit_code) {
    return fmt::format("{} failed (status = {})", name, *exit_code);
  }
  if (!trimmed.empty()) {
    return fmt::format("{} failed: {}", name, trimmed);
  }
  return fmt::format("{} failed", name);
}

auto check(std::string_view name, Output output, bool show_stdout) -> Result<std::string> {
  core::log::trace(
      "{}: {}, #lines stdout={}, #lines stderr={}",
      name,
      output.describe_status(),
      core::lines(output.stdout_).size(),
      core::lines(output.stderr_).size()
  );

  if (!output.success()) {
    auto error_text = core::to_utf8_lossy(output.stderr_);
    return std::unexpected(core::Error{failure_message(name, output.exit_code(), error_text), output.exit_code()});
  }

  for (auto line : core::lines(output.stderr_)) {
    core::log::warn("{}: {}", name, core::escape_ascii(line));
  }
  if (show_stdout) {
    for (auto line : core::lines(output.stdout_)) {
      core::log::info("{}: {}", name, core::escape_ascii(line));
    }
  }
  return std::move(output.stdout_);
}

} // namespace initbench::process

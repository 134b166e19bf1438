#pragma once

namespace initbench::core {

constexpr char const* EXE_NAME    = "initbench";
constexpr char const* EXE_DESC    = "Benchmark helpers for mkinitcpio compression methods";
constexpr char const* VERSION     = "0.1.0";
constexpr char const* LOG_ENV_VAR = "INITBENCH_LOG";

// Shell oracle
constexpr char const* BASH_PATH       = "/usr/bin/bash";
constexpr char const* SENTINEL_VAR    = "OUTPUT";
constexpr char const* DEFAULT_WORKDIR = "/";

// mkinitcpio layout
constexpr char const* MKINITCPIO_PATH     = "/usr/bin/mkinitcpio";
constexpr char const* DEFAULT_CONFIG_PATH = "/etc/mkinitcpio.conf";
constexpr char const* CONFIG_DROP_IN_DIR  = "/etc/mkinitcpio.conf.d";
constexpr char const* DEFAULT_PRESET_DIR  = "/etc/mkinitcpio.d";

constexpr int SIGNAL_EXIT_CODE_OFFSET = 128;

} // namespace initbench::core

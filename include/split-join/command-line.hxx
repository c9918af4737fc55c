#pragma once

#include <split-join/join.hxx>

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace split_join {

/// @brief Invalid or incomplete command line / configuration.
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @struct CommandLine
 * @brief Parsed invocation of the split-join tool.
 */
struct CommandLine {
  JoinOptions options;
  std::filesystem::path part; /**< @brief Any part of the archive. */
  bool info = false;          /**< @brief Describe instead of joining. */
  bool help = false;
};

/// Largest accepted `--block-size`; one buffer of this size is allocated.
inline constexpr std::size_t kMaxBlockSize = 64 * 1024 * 1024;

/// Prefix of environment variables read as options (SPLIT_JOIN_BLOCK_SIZE).
inline constexpr const char *kEnvironmentPrefix = "SPLIT_JOIN_";

/**
 * @brief Parse arguments, environment and an optional config file.
 *
 * Values given on the command line win over the environment, which wins over
 * the file named by `--config`.
 *
 * @throws UsageError on unknown options, bad values or a missing part path.
 */
CommandLine parse_command_line(int argc, const char *const argv[]);

/// @brief Usage text listing every option.
std::string usage();
} // namespace split_join

#include <split-join/command-line.hxx>
#include <split-join/errors.hxx>
#include <split-join/join.hxx>
#include <split-join/log.hxx>
#include <split-join/terminal-progress-bar.hxx>

#include <fmt/format.h>

#include <cstdio>
#include <exception>
#include <optional>

namespace split_join {
namespace {

int run(int argc, char *argv[]) {
  CommandLine command;
  try {
    command = parse_command_line(argc, argv);
  } catch (const UsageError &e) {
    log::error("{}", e.what());
    fmt::print(stderr, "\n{}", usage());
    return 2;
  }

  if (command.help) {
    fmt::print("{}", usage());
    return 0;
  }
  log::set_level(command.options.log_level);

  try {
    if (command.info) {
      auto const context = prepare_join(command.part, command.options);
      fmt::print("{}", describe(context));
      return 0;
    }

    std::optional<TerminalProgressBar> verify_bar;
    std::optional<TerminalProgressBar> join_bar;
    if (command.options.show_progress) {
      verify_bar.emplace("verify");
      join_bar.emplace("join  ");
    }

    auto const result =
        join_archive(command.part, command.options,
                     join_bar ? &*join_bar : nullptr,
                     verify_bar ? &*verify_bar : nullptr);
    log::info("{}: {} bytes written{}", result.output.string(),
              result.bytes_written,
              result.verified ? ", checksums verified" : "");
  } catch (const JoinError &e) {
    log::error("{}", e.what());
    return 1;
  } catch (const std::exception &e) {
    log::error("{}: {}", command.part.string(), e.what());
    return 1;
  }
  return 0;
}

} // unnamed namespace
} // namespace split_join

int main(int argc, char *argv[]) { return split_join::run(argc, argv); }

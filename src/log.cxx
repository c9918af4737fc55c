#include <split-join/log.hxx>

#include <boost/algorithm/string/predicate.hpp>

#include <atomic>
#include <mutex>

namespace split_join::log {
namespace {

std::mutex &output_mutex() noexcept {
  static std::mutex mutex;
  return mutex;
}

std::atomic<Level> &threshold() noexcept {
  static std::atomic<Level> value{Level::info};
  return value;
}

std::atomic<std::FILE *> &output() noexcept {
  static std::atomic<std::FILE *> stream{nullptr};
  return stream;
}

std::string_view prefix_impl(Level severity) noexcept {
  switch (severity) {
  case Level::error:
    return "error: ";
  case Level::warning:
    return "warning: ";
  case Level::info:
    return "";
  case Level::debug:
    return "debug: ";
  }
  return "";
}

} // unnamed namespace

void set_level(Level value) noexcept { threshold().store(value); }

Level level() noexcept { return threshold().load(); }

void set_output(std::FILE *stream) noexcept { output().store(stream); }

std::optional<Level> parse_level(std::string_view name) {
  using boost::algorithm::iequals;
  if (iequals(name, "error"))
    return Level::error;
  if (iequals(name, "warning") || iequals(name, "warn"))
    return Level::warning;
  if (iequals(name, "info"))
    return Level::info;
  if (iequals(name, "debug"))
    return Level::debug;
  return std::nullopt;
}

namespace detail {
void write(Level severity, std::string_view message) {
  std::lock_guard<std::mutex> lock{output_mutex()};

  std::FILE *stream = output().load();
  if (stream == nullptr)
    stream = stderr;
  fmt::print(stream, "{}{}\n", prefix_impl(severity), message);
  std::fflush(stream);
}
} // namespace detail
} // namespace split_join::log

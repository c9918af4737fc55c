#include <split-join/terminal-progress-bar.hxx>

#include <fmt/format.h>

#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace split_join {
namespace {

constexpr std::size_t kMinimumBarWidth = 10;

} // unnamed namespace

TerminalProgressBar::TerminalProgressBar(std::string label, std::FILE *stream,
                                         std::optional<std::size_t> width)
    : label_(std::move(label)), stream_(stream),
      width_(width ? *width
                   : detect_width(stream ? fileno(stream) : -1)) {}

std::size_t TerminalProgressBar::detect_width(int fd, std::size_t fallback) {
  if (fd < 0 || !isatty(fd))
    return fallback;
  struct winsize w {};
  if (ioctl(fd, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
    return w.ws_col;
  return fallback;
}

std::string TerminalProgressBar::render() const {
  auto const percent = static_cast<int>(std::floor(fraction_ * 100.0));
  auto const prefix = label_.empty() ? std::string() : label_ + " ";
  auto const suffix = fmt::format(" {:>3}%", percent);

  // Keep the last column free: writing into it wraps on most terminals.
  auto const usable = width_ > 0 ? width_ - 1 : 0;
  auto const overhead = prefix.size() + 2 + suffix.size();
  auto const bar_width =
      usable > overhead + kMinimumBarWidth ? usable - overhead
                                           : kMinimumBarWidth;

  auto filled = static_cast<std::size_t>(
      std::floor(fraction_ * static_cast<double>(bar_width)));
  filled = std::min(filled, bar_width);

  std::string bar(bar_width, ' ');
  std::fill_n(bar.begin(), filled, '=');
  if (filled > 0 && filled < bar_width)
    bar[filled - 1] = '>';

  return fmt::format("{}[{}]{}", prefix, bar, suffix);
}

void TerminalProgressBar::update(double fraction) {
  fraction_ = std::clamp(fraction, 0.0, 1.0);
  if (stream_ == nullptr || finished_)
    return;

  auto text = render();
  if (text != drawn_) {
    fmt::print(stream_, "\r{}", text);
    drawn_ = std::move(text);
  }
  if (fraction_ >= 1.0) {
    fmt::print(stream_, "\n");
    finished_ = true;
  }
  std::fflush(stream_);
}
} // namespace split_join

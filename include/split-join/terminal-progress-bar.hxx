#pragma once

#include <split-join/progress.hxx>

#include <cstddef>
#include <cstdio>
#include <optional>
#include <string>

namespace split_join {

/**
 * @class TerminalProgressBar
 * @brief Progress sink drawing `label [=====>    ]  42%` on one terminal line.
 *
 * The line is redrawn in place only when its text changes, and terminated with
 * a newline once the fraction reaches 1.
 */
class TerminalProgressBar : public ProgressSink {
public:
  /// Width used when the terminal size cannot be determined.
  static constexpr std::size_t kFallbackWidth = 80;

  /**
   * @param label Text printed in front of the bar.
   * @param stream Output stream; its terminal width is detected.
   * @param width Forces a width instead of detecting it.
   */
  explicit TerminalProgressBar(std::string label = {},
                               std::FILE *stream = stderr,
                               std::optional<std::size_t> width = std::nullopt);

  void update(double fraction) override;

  /// @brief Text of the bar for the current fraction. Takes width() - 1
  /// columns unless the label leaves less than a minimal bar.
  std::string render() const;

  std::size_t width() const noexcept { return width_; }
  double fraction() const noexcept { return fraction_; }

  /// @brief Columns of the terminal behind @p fd, or @p fallback.
  static std::size_t detect_width(int fd,
                                  std::size_t fallback = kFallbackWidth);

private:
  std::string label_;
  std::FILE *stream_;
  std::size_t width_;
  double fraction_ = 0.0;
  std::string drawn_;
  bool finished_ = false;
};
} // namespace split_join

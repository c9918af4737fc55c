#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace split_join {
/**
 * @class JoinError
 * @brief Base class of every failure raised while joining a split archive.
 *
 * Each error carries the path of the part (or output) file it concerns so the
 * command-line front end can name the failing file.
 */
class JoinError : public std::runtime_error {
public:
  JoinError(const std::filesystem::path &path, const std::string &message);

  /// @brief File the failure concerns.
  const std::filesystem::path &path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

/// @brief A path does not follow the `<base>.<NNN>.<ext>` naming scheme.
class InvalidNameError : public JoinError {
public:
  explicit InvalidNameError(const std::filesystem::path &path);
};

/// @brief A part of the contiguous sequence 1..N is absent.
class MissingPartError : public JoinError {
public:
  MissingPartError(const std::filesystem::path &expected_path,
                   std::uint32_t index);

  std::uint32_t index() const noexcept { return index_; }

private:
  std::uint32_t index_;
};

/// @brief Two directory entries resolve to the same part index.
class DuplicatePartError : public JoinError {
public:
  DuplicatePartError(const std::filesystem::path &path, std::uint32_t index);
};

/// @brief A file could not be opened, read, written or renamed.
class FileAccessError : public JoinError {
public:
  FileAccessError(const std::filesystem::path &path, const std::string &what);
};

/// @brief The first part is shorter than the fixed header.
class TruncatedHeaderError : public JoinError {
public:
  TruncatedHeaderError(const std::filesystem::path &path,
                       std::uint64_t available);
};

/// @brief The header decodes but describes an archive that cannot be joined.
class InvalidHeaderError : public JoinError {
public:
  InvalidHeaderError(const std::filesystem::path &path,
                     const std::string &reason);
};

/// @brief The last part is shorter than its checksum manifest.
class TruncatedTrailerError : public JoinError {
public:
  TruncatedTrailerError(const std::filesystem::path &path,
                        std::uint64_t file_size, std::uint64_t trailer_size);
};

/// @brief Header and/or trailer do not fit inside a part.
class InvalidRangeError : public JoinError {
public:
  InvalidRangeError(const std::filesystem::path &path, std::uint64_t raw_size,
                    std::uint64_t overhead);
};

/**
 * @brief The number of located parts disagrees with the number the archive
 * declares (checksum records or header part count).
 */
class PartCountMismatchError : public JoinError {
public:
  PartCountMismatchError(const std::filesystem::path &path, std::size_t found,
                         std::size_t expected);

  std::size_t found() const noexcept { return found_; }
  std::size_t expected() const noexcept { return expected_; }

private:
  std::size_t found_;
  std::size_t expected_;
};

/// @brief A part's digest differs from its manifest record.
class ChecksumMismatchError : public JoinError {
public:
  ChecksumMismatchError(const std::filesystem::path &path,
                        const std::string &expected,
                        const std::string &actual);

  const std::string &expected() const noexcept { return expected_; }
  const std::string &actual() const noexcept { return actual_; }

private:
  std::string expected_;
  std::string actual_;
};

/// @brief A part ended before its payload range was exhausted.
class ShortReadError : public JoinError {
public:
  ShortReadError(const std::filesystem::path &path, std::uint64_t expected,
                 std::uint64_t actual);
};
} // namespace split_join

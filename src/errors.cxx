#include <split-join/errors.hxx>

#include <fmt/format.h>

namespace split_join {

JoinError::JoinError(const std::filesystem::path &path,
                     const std::string &message)
    : std::runtime_error(message), path_(path) {}

InvalidNameError::InvalidNameError(const std::filesystem::path &path)
    : JoinError(path,
                fmt::format("{}: not a part file (expected <name>.<NNN>.<ext>)",
                            path.string())) {}

MissingPartError::MissingPartError(const std::filesystem::path &expected_path,
                                   std::uint32_t index)
    : JoinError(expected_path,
                fmt::format("{}: part {:03} is missing", expected_path.string(),
                            index)),
      index_(index) {}

DuplicatePartError::DuplicatePartError(const std::filesystem::path &path,
                                       std::uint32_t index)
    : JoinError(path, fmt::format("{}: part {:03} appears more than once",
                                  path.string(), index)) {}

FileAccessError::FileAccessError(const std::filesystem::path &path,
                                 const std::string &what)
    : JoinError(path, fmt::format("{}: {}", path.string(), what)) {}

TruncatedHeaderError::TruncatedHeaderError(const std::filesystem::path &path,
                                           std::uint64_t available)
    : JoinError(path,
                fmt::format("{}: truncated header ({} bytes available)",
                            path.string(), available)) {}

InvalidHeaderError::InvalidHeaderError(const std::filesystem::path &path,
                                       const std::string &reason)
    : JoinError(path,
                fmt::format("{}: invalid header: {}", path.string(), reason)) {}

TruncatedTrailerError::TruncatedTrailerError(const std::filesystem::path &path,
                                             std::uint64_t file_size,
                                             std::uint64_t trailer_size)
    : JoinError(path, fmt::format("{}: truncated checksum trailer ({} bytes "
                                  "in file, {} bytes of checksums expected)",
                                  path.string(), file_size, trailer_size)) {}

InvalidRangeError::InvalidRangeError(const std::filesystem::path &path,
                                     std::uint64_t raw_size,
                                     std::uint64_t overhead)
    : JoinError(path, fmt::format("{}: {} bytes cannot hold {} bytes of "
                                  "header and trailer",
                                  path.string(), raw_size, overhead)) {}

PartCountMismatchError::PartCountMismatchError(
    const std::filesystem::path &path, std::size_t found, std::size_t expected)
    : JoinError(path, fmt::format("{}: found {} parts, archive declares {}",
                                  path.string(), found, expected)),
      found_(found), expected_(expected) {}

ChecksumMismatchError::ChecksumMismatchError(const std::filesystem::path &path,
                                             const std::string &expected,
                                             const std::string &actual)
    : JoinError(path, fmt::format("{}: checksum mismatch (expected {}, got {})",
                                  path.string(), expected, actual)),
      expected_(expected), actual_(actual) {}

ShortReadError::ShortReadError(const std::filesystem::path &path,
                               std::uint64_t expected, std::uint64_t actual)
    : JoinError(path,
                fmt::format("{}: unexpected end of file after {} of {} "
                            "payload bytes",
                            path.string(), actual, expected)) {}
} // namespace split_join

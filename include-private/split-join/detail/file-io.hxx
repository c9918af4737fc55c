#pragma once

#include <split-join/errors.hxx>

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/read.hpp>

#include <cstddef>
#include <filesystem>
#include <ios>

namespace split_join::detail {

/**
 * @brief Open @p path as a binary Boost.Iostreams file source.
 *
 * @throws FileAccessError when the file cannot be opened.
 */
inline boost::iostreams::file_source
open_source(const std::filesystem::path &path) {
  boost::iostreams::file_source source(path.string(), std::ios_base::binary);
  if (!source.is_open())
    throw FileAccessError(path, "cannot open for reading");
  return source;
}

/**
 * @brief Read up to @p size bytes, retrying short reads.
 *
 * @return std::size_t Bytes read; less than @p size only at end of input.
 */
template <typename Source>
std::size_t read_fully(Source &source, char *dest, std::size_t size) {
  std::size_t filled = 0;
  while (filled < size) {
    auto const amt = boost::iostreams::read(
        source, dest + filled, static_cast<std::streamsize>(size - filled));
    if (amt <= 0)
      break;
    filled += static_cast<std::size_t>(amt);
  }
  return filled;
}
} // namespace split_join::detail

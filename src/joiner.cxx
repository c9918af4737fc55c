#include <split-join/detail/file-io.hxx>
#include <split-join/errors.hxx>
#include <split-join/joiner.hxx>
#include <split-join/log.hxx>
#include <split-join/part-filter.hxx>

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/write.hpp>

#include <stdexcept>
#include <vector>

namespace split_join {
namespace io = boost::iostreams;

namespace {

/// @brief Write all of @p size bytes or fail.
void write_block_impl(io::file_sink &sink, const char *data,
                      std::streamsize size,
                      const std::filesystem::path &destination) {
  if (io::write(sink, data, size) != size)
    throw FileAccessError(destination, "write failed");
}

} // unnamed namespace

Joiner::Joiner(std::size_t block_size, ProgressSink *progress)
    : block_size_(block_size), sink_(progress) {
  if (block_size_ == 0)
    throw std::invalid_argument("block size must be positive");
}

std::uint64_t Joiner::join(const std::vector<PartDescriptor> &parts,
                           const std::filesystem::path &destination,
                           std::uint64_t declared_size) {
  progress_ = JoinProgress{0, declared_size};

  io::file_sink sink(destination.string(),
                     std::ios_base::binary | std::ios_base::trunc);
  if (!sink.is_open())
    throw FileAccessError(destination, "cannot open for writing");

  std::vector<char> buffer(block_size_);
  auto const block = static_cast<std::streamsize>(buffer.size());

  for (auto const &part : parts) {
    io::filtering_istream in;
    in.push(PartFilter<>(part.range.begin, part.range.length(), block));
    in.push(detail::open_source(part.path));

    std::uint64_t copied = 0;
    while (in) {
      in.read(buffer.data(), block);
      auto const got = in.gcount();
      if (got <= 0)
        break;
      write_block_impl(sink, buffer.data(), got, destination);
      copied += static_cast<std::uint64_t>(got);
      progress_.bytes_written += static_cast<std::uint64_t>(got);
      if (sink_)
        sink_->update(progress_.fraction());
    }
    if (in.bad())
      throw FileAccessError(part.path, "read failed");
    if (copied != part.range.length())
      throw ShortReadError(part.path, part.range.length(), copied);

    log::debug("{}: copied {} payload bytes", part.path.string(), copied);
  }

  if (!sink.flush())
    throw FileAccessError(destination, "flush failed");
  sink.close();

  if (sink_ && progress_.bytes_written == 0)
    sink_->update(progress_.fraction());
  return progress_.bytes_written;
}
} // namespace split_join

#include <split-join/detail/file-io.hxx>
#include <split-join/errors.hxx>
#include <split-join/integrity-checker.hxx>
#include <split-join/log.hxx>

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace split_join {

IntegrityChecker::IntegrityChecker(DigestFactory factory,
                                   std::size_t block_size)
    : factory_(std::move(factory)), block_size_(block_size) {
  if (block_size_ == 0)
    throw std::invalid_argument("block size must be positive");
  if (!factory_)
    throw std::invalid_argument("digest factory is empty");
  auto const probe = factory_();
  if (!probe || probe->hex_length() != kChecksumRecordSize)
    throw std::invalid_argument(
        "digest width does not match the checksum record width");
}

std::string IntegrityChecker::digest_prefix(const std::filesystem::path &path,
                                            std::uint64_t length) const {
  return digest_impl(path, length, {});
}

std::string IntegrityChecker::digest_impl(const std::filesystem::path &path,
                                          std::uint64_t length,
                                          const BlockCallback &on_block) const {
  auto digest = factory_();
  auto source = detail::open_source(path);

  std::vector<char> buffer(block_size_);
  std::uint64_t done = 0;
  while (done < length) {
    auto const want = static_cast<std::size_t>(
        std::min<std::uint64_t>(length - done, buffer.size()));
    auto const got = detail::read_fully(source, buffer.data(), want);
    digest->update(buffer.data(), got);
    done += got;
    if (on_block)
      on_block(got);
    if (got < want)
      throw ShortReadError(path, length, done);
  }
  return digest->hex_digest();
}

void IntegrityChecker::verify(const std::vector<PartDescriptor> &parts,
                              const ChecksumManifest &manifest,
                              std::uint64_t trailer_size,
                              ProgressSink *progress) const {
  if (parts.size() != manifest.size())
    throw PartCountMismatchError(
        parts.empty() ? std::filesystem::path() : parts.back().path,
        parts.size(), manifest.size());

  std::vector<std::uint64_t> lengths;
  lengths.reserve(parts.size());
  std::uint64_t total = 0;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    auto const &part = parts[i];
    std::uint64_t length = part.raw_size;
    if (i + 1 == parts.size()) {
      if (part.raw_size < trailer_size)
        throw InvalidRangeError(part.path, part.raw_size, trailer_size);
      length -= trailer_size;
    }
    lengths.push_back(length);
    total += length;
  }

  std::uint64_t digested = 0;
  auto on_block = [&](std::size_t amount) {
    digested += amount;
    if (!progress)
      return;
    auto const fraction = total == 0 ? 1.0
                                     : static_cast<double>(digested) /
                                           static_cast<double>(total);
    progress->update(std::min(1.0, fraction));
  };

  for (std::size_t i = 0; i < parts.size(); ++i) {
    auto const &part = parts[i];
    auto const actual = digest_impl(part.path, lengths[i], on_block);
    if (!boost::algorithm::iequals(actual, manifest[i]))
      throw ChecksumMismatchError(part.path, manifest[i], actual);
    log::debug("{}: checksum {} OK", part.path.string(), actual);
  }
}
} // namespace split_join

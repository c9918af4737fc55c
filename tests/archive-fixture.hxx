#pragma once

#include <split-join/archive-header.hxx>
#include <split-join/digest.hxx>

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

namespace split_join::test {
namespace fs = std::filesystem;

/**
 * @brief Fresh directory under the system temp directory, removed on
 * destruction.
 */
class TemporaryDirectory {
public:
  TemporaryDirectory() {
    auto const *info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = "split-join";
    if (info != nullptr) {
      name += '-';
      name += info->test_suite_name();
      name += '-';
      name += info->name();
    }
    for (auto &c : name)
      if (c == '/')
        c = '_';
    path_ = fs::temp_directory_path() / name;
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~TemporaryDirectory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TemporaryDirectory(const TemporaryDirectory &) = delete;
  TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;

  const fs::path &path() const noexcept { return path_; }

private:
  fs::path path_;
};

/// @brief Write @p bytes to @p path, replacing any previous content.
inline void write_file(const fs::path &path, std::string_view bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

/// @brief Whole content of @p path.
inline std::string read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>{});
}

/// @brief Deterministic pseudo-random bytes.
inline std::string random_bytes(std::size_t size, std::uint32_t seed = 1) {
  std::mt19937 engine(seed);
  std::uniform_int_distribution<int> byte(0, 255);
  std::string bytes(size, '\0');
  for (auto &c : bytes)
    c = static_cast<char>(byte(engine));
  return bytes;
}

/// @brief Uppercase MD5 of @p bytes.
inline std::string md5_hex(std::string_view bytes) {
  Md5Digest digest;
  digest.update(bytes.data(), bytes.size());
  return digest.hex_digest();
}

/**
 * @brief Encode @p header in the 104-byte on-disk layout.
 *
 * Names longer than their windows are written with their real length byte
 * but only the window's worth of text, as a careless producer would.
 */
inline std::string encode_header(const ArchiveHeader &header) {
  std::string bytes(kHeaderSize, '\0');
  auto put_text = [&bytes](std::size_t offset, std::size_t capacity,
                           const std::string &text) {
    bytes[offset] = static_cast<char>(text.size());
    bytes.replace(offset + 1, std::min(text.size(), capacity), text, 0,
                  std::min(text.size(), capacity));
  };
  put_text(0, kSoftwareNameCapacity, header.software_name);
  put_text(40, kOutputNameCapacity, header.output_name);
  bytes[91] = header.has_checksums ? 1 : 0;
  for (std::size_t i = 0; i < 4; ++i)
    bytes[92 + i] = static_cast<char>((header.part_count >> (8 * i)) & 0xff);
  for (std::size_t i = 0; i < 8; ++i)
    bytes[96 + i] = static_cast<char>((header.payload_size >> (8 * i)) & 0xff);
  return bytes;
}

/**
 * @struct ArchiveFixture
 * @brief A split archive written to disk for a test.
 */
struct ArchiveFixture {
  std::vector<fs::path> parts;          /**< @brief In part order. */
  std::vector<std::string> raw;         /**< @brief Raw content per part. */
  std::string payload;                  /**< @brief Expected joined output. */
  ArchiveHeader header;
  std::vector<std::string> manifest;    /**< @brief Empty without checksums. */
};

/**
 * @brief Split @p payload into parts of @p payload_sizes bytes and write them
 * as `<base>.NNN.<extension>` files in @p directory.
 *
 * The header goes in front of the first part and, when @p checksums is set,
 * the MD5 manifest behind the last one.
 */
inline ArchiveFixture
write_archive(const fs::path &directory, const std::string &base,
              const std::vector<std::size_t> &payload_sizes,
              bool checksums = true, const std::string &output_name = "out.bin",
              const std::string &extension = "xtm") {
  ArchiveFixture fixture;
  std::size_t total = 0;
  for (auto size : payload_sizes)
    total += size;
  fixture.payload = random_bytes(total, static_cast<std::uint32_t>(total));

  fixture.header.software_name = "Xtremsplit";
  fixture.header.output_name = output_name;
  fixture.header.has_checksums = checksums;
  fixture.header.part_count = static_cast<std::uint32_t>(payload_sizes.size());
  fixture.header.payload_size = total;

  std::size_t offset = 0;
  for (std::size_t i = 0; i < payload_sizes.size(); ++i) {
    std::string raw;
    if (i == 0)
      raw += encode_header(fixture.header);
    raw += fixture.payload.substr(offset, payload_sizes[i]);
    offset += payload_sizes[i];
    fixture.raw.push_back(raw);
    if (checksums)
      fixture.manifest.push_back(md5_hex(raw));
  }
  if (checksums)
    for (auto const &record : fixture.manifest)
      fixture.raw.back() += record;

  for (std::size_t i = 0; i < fixture.raw.size(); ++i) {
    auto path = directory / fmt::format("{}.{:03}.{}", base, i + 1, extension);
    write_file(path, fixture.raw[i]);
    fixture.parts.push_back(path);
  }
  return fixture;
}
} // namespace split_join::test

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace split_join {

/**
 * @class DigestAlgorithm
 * @brief Incremental content digest producing an uppercase hex string.
 *
 * The width of the hex string must match the width of the manifest records
 * (kChecksumRecordSize); the trailer-length arithmetic depends on it.
 */
class DigestAlgorithm {
public:
  virtual ~DigestAlgorithm() = default;

  /// @brief Start a new digest, discarding any bytes fed so far.
  virtual void reset() = 0;

  /// @brief Feed @p size bytes starting at @p data.
  virtual void update(const char *data, std::size_t size) = 0;

  /// @brief Finish the digest and return it as uppercase hex.
  virtual std::string hex_digest() = 0;

  /// @brief Number of hex characters hex_digest() returns.
  virtual std::size_t hex_length() const noexcept = 0;
};

/// @brief Produces a fresh digest per part.
using DigestFactory = std::function<std::unique_ptr<DigestAlgorithm>()>;

/**
 * @class Md5Digest
 * @brief MD5 through the OpenSSL EVP interface.
 */
class Md5Digest : public DigestAlgorithm {
public:
  Md5Digest();
  ~Md5Digest() override;

  Md5Digest(const Md5Digest &) = delete;
  Md5Digest &operator=(const Md5Digest &) = delete;

  void reset() override;
  void update(const char *data, std::size_t size) override;
  std::string hex_digest() override;
  std::size_t hex_length() const noexcept override { return 32; }

private:
  struct Context;
  std::unique_ptr<Context> context_;
};

/// @brief Factory for the algorithm the manifest records use (MD5).
DigestFactory default_digest_factory();
} // namespace split_join

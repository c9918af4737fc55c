#include <split-join/digest.hxx>

#include <boost/algorithm/hex.hpp>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <iterator>
#include <stdexcept>

namespace split_join {
namespace {

/// @brief Throw with the most recent OpenSSL error attached.
[[noreturn]] void throw_openssl_error_impl(const char *operation) {
  std::array<char, 256> reason{};
  ERR_error_string_n(ERR_get_error(), reason.data(), reason.size());
  throw std::runtime_error(std::string(operation) + ": " + reason.data());
}

} // unnamed namespace

struct Md5Digest::Context {
  struct Free {
    void operator()(EVP_MD_CTX *ctx) const noexcept { EVP_MD_CTX_free(ctx); }
  };
  std::unique_ptr<EVP_MD_CTX, Free> ctx;
};

Md5Digest::Md5Digest() : context_(std::make_unique<Context>()) {
  context_->ctx.reset(EVP_MD_CTX_new());
  if (!context_->ctx)
    throw_openssl_error_impl("EVP_MD_CTX_new");
  reset();
}

Md5Digest::~Md5Digest() = default;

void Md5Digest::reset() {
  if (EVP_DigestInit_ex(context_->ctx.get(), EVP_md5(), nullptr) != 1)
    throw_openssl_error_impl("EVP_DigestInit_ex");
}

void Md5Digest::update(const char *data, std::size_t size) {
  if (size == 0)
    return;
  if (EVP_DigestUpdate(context_->ctx.get(), data, size) != 1)
    throw_openssl_error_impl("EVP_DigestUpdate");
}

std::string Md5Digest::hex_digest() {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(context_->ctx.get(), digest.data(), &length) != 1)
    throw_openssl_error_impl("EVP_DigestFinal_ex");

  std::string hex;
  hex.reserve(length * 2);
  // boost::algorithm::hex emits uppercase digits.
  boost::algorithm::hex(digest.begin(), digest.begin() + length,
                        std::back_inserter(hex));
  return hex;
}

DigestFactory default_digest_factory() {
  return [] { return std::make_unique<Md5Digest>(); };
}
} // namespace split_join

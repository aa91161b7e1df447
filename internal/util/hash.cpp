#include "hash.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <initializer_list>
#include <memory>
#include <stdexcept>

namespace audit::util {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
  }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

[[noreturn]] void ThrowOpenSSL(const char* what) {
  char buf[256];
  ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
  throw std::runtime_error(std::string(what) + ": " + buf);
}

std::string ToHex(const unsigned char* data, unsigned int size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (unsigned int i = 0; i < size; ++i) {
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
  return out;
}

std::string DigestParts(std::initializer_list<std::string_view> parts) {
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) ThrowOpenSSL("EVP_MD_CTX_new");

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) ThrowOpenSSL("EVP_DigestInit_ex(EVP_sha256)");

  for (auto part : parts) {
    if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) ThrowOpenSSL("EVP_DigestUpdate");
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int                               len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1) ThrowOpenSSL("EVP_DigestFinal_ex");

  return ToHex(digest.data(), len);
}

} // namespace

std::string Sha256Hex(std::string_view data) {
  return DigestParts({data});
}

std::string ChainHash(std::string_view previous_hash, std::string_view payload) {
  return DigestParts({previous_hash, payload});
}

} // namespace audit::util

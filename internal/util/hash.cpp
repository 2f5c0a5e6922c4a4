#include "hash.hpp"

#include <openssl/evp.h>

#include <memory>

#include "internal/util/errors.hpp"

namespace engram::util {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

} // namespace

Sha256Digest Sha256(std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw StoreError("sha256: failed to create EVP_MD_CTX");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw StoreError("sha256: init failed");
  }
  if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw StoreError("sha256: update failed");
  }

  Sha256Digest digest{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1 || len != digest.size()) {
    throw StoreError("sha256: finalize failed");
  }
  return digest;
}

std::uint64_t Sha256Prefix64(std::string_view data) {
  const auto    digest = Sha256(data);
  std::uint64_t value  = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    value = (value << 8) | digest[i];
  }
  return value;
}

} // namespace engram::util

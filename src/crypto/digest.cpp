#include <credence/common/critical.hpp>
#include <credence/crypto/digest.hpp>

#include <openssl/evp.h>

#include <memory>

namespace credence::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

credence::schema::hash32_t sha256(const credence::schema::bytes_view_t& data) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    credence::common::critical("EVP_MD_CTX_new failed");
  }

  auto digest = credence::schema::hash32_t{};
  auto length = static_cast<unsigned int>(digest.size());
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
    credence::common::critical("SHA-256 digest failed");
  }
  return digest;
}

credence::schema::certificate_hash_t certificate_hash(
    const credence::schema::bytes_view_t& document) {
  return credence::schema::to_hex(sha256(document));
}

}  // namespace credence::crypto

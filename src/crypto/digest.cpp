#include <consign/common/critical.hpp>
#include <consign/crypto/digest.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <memory>

namespace consign::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

consign::schema::hash64_t digest_sha512(const void* data, std::size_t size) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    consign::common::critical("failed to allocate SHA-512 context");
  }

  auto out = consign::schema::hash64_t{};
  auto written = 0u;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha512(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &written) != 1 ||
      written != out.size()) {
    consign::common::critical("SHA-512 digest failed");
  }
  return out;
}

}  // namespace

consign::schema::hash64_t sha512(const consign::schema::bytes_view_t& bytes) {
  return digest_sha512(bytes.data(), bytes.size());
}

consign::schema::hash64_t sha512(const std::string_view& str) {
  return digest_sha512(str.data(), str.size());
}

std::string sha512_hex(const std::string_view& str, std::size_t length) {
  auto digest = sha512(str);
  auto hex = consign::schema::to_hex(
      consign::schema::bytes_view_t{digest.data(), digest.size()});
  hex.resize(std::min(length, hex.size()));
  return hex;
}

}  // namespace consign::crypto

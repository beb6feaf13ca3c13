#include <covenant/common/critical.hpp>
#include <covenant/sha256/hash.hpp>

#include <openssl/evp.h>

#include <memory>

namespace covenant::sha256 {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

covenant::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    covenant::common::critical("failed to allocate EVP_MD_CTX");
  }
  auto output = covenant::schema::hash32_t{};
  auto written = 0u;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), output.data(), &written) != 1 ||
      written != output.size()) {
    covenant::common::critical("OpenSSL sha256 digest failed");
  }
  return output;
}

}  // namespace

covenant::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

covenant::schema::hash32_t hash(const covenant::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

covenant::schema::hash32_t double_hash(
    const covenant::schema::bytes_view_t& bytes) {
  auto first = hash(bytes);
  return hash(covenant::schema::make_bytes_view(first));
}

}  // namespace covenant::sha256

#include "content_hasher.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

#include "upload_error.hpp"
#include "utils.hpp"

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

const EVP_MD* digest_for(HashAlgorithm algorithm) {
  return algorithm == HashAlgorithm::Sha256 ? EVP_sha256() : EVP_md5();
}

DigestContext begin_digest(HashAlgorithm algorithm) {
  DigestContext ctx(EVP_MD_CTX_new());
  if(!ctx) throw UploadError::hash_failed("unable to allocate digest context");
  if(EVP_DigestInit_ex(ctx.get(), digest_for(algorithm), nullptr) != 1) {
    throw UploadError::hash_failed("digest init failed");
  }
  return ctx;
}

void update_digest(EVP_MD_CTX* ctx, const char* data, std::size_t size) {
  if(size == 0) return;
  if(EVP_DigestUpdate(ctx, data, size) != 1) {
    throw UploadError::hash_failed("digest update failed");
  }
}

std::string finish_digest(EVP_MD_CTX* ctx) {
  std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
  unsigned int length = 0;
  if(EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
    throw UploadError::hash_failed("digest final failed");
  }
  digest.resize(length);
  return hex_from_bytes(digest);
}

} // namespace

HashAlgorithm parse_hash_algorithm(const std::string& name) {
  auto lowered = to_lower_copy(name);
  if(lowered == "md5") return HashAlgorithm::Md5;
  if(lowered == "sha256" || lowered == "sha-256") return HashAlgorithm::Sha256;
  throw std::invalid_argument("unknown hash algorithm '" + name + "'");
}

const char* to_string(HashAlgorithm algorithm) {
  return algorithm == HashAlgorithm::Sha256 ? "sha256" : "md5";
}

ContentHasher::ContentHasher(HashAlgorithm algorithm, std::size_t window_bytes)
  : algorithm_(algorithm),
    window_bytes_(window_bytes == 0 ? kDefaultWindowBytes : window_bytes) {}

std::string ContentHasher::hash(const ByteSource& source,
                                const CancellationHandle* cancel,
                                const ProgressCallback& on_progress) const {
  auto ctx = begin_digest(algorithm_);
  const uint64_t total = source.size();
  uint64_t offset = 0;
  while(offset < total) {
    if(cancel) cancel->throw_if_cancelled();
    auto length = static_cast<std::size_t>(std::min<uint64_t>(window_bytes_, total - offset));
    std::vector<char> window;
    try {
      window = source.read(offset, length);
    } catch(const std::exception& e) {
      throw UploadError::hash_failed(e.what());
    }
    update_digest(ctx.get(), window.data(), window.size());
    offset += length;
    if(on_progress) on_progress(offset, total);
  }
  return finish_digest(ctx.get());
}

std::string ContentHasher::hash_bytes(const std::string& bytes) const {
  auto ctx = begin_digest(algorithm_);
  update_digest(ctx.get(), bytes.data(), bytes.size());
  return finish_digest(ctx.get());
}

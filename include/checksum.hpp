#pragma once

#include "logger.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// forward declared to keep openssl headers out of the interface
struct evp_md_ctx_st;

namespace chunkdl {

/* chunkdl::checksum
 *
 * One incremental digest, fed chunk by chunk. Wraps an OpenSSL EVP_MD_CTX, so
 * any algorithm name OpenSSL knows (md5, sha1, sha256, sha3-512, ...) is
 * accepted, case-insensitive. Throws std::runtime_error for an unknown or
 * unusable algorithm.
 */
class checksum {
public:
  explicit checksum(const std::string& algorithm);

  checksum(const checksum& other)          = delete;
  checksum& operator=(const checksum& rhs) = delete;

  checksum(checksum&& other) noexcept;
  checksum& operator=(checksum&& rhs) noexcept;

  ~checksum();

  void update(const char* data, std::size_t size);
  void update(std::string_view chunk) { update(chunk.data(), chunk.size()); }

  // does not disturb the running state, can be called again after more updates
  [[nodiscard]] std::string hexdigest() const;

  // upper-cased, as used in the result map and log lines
  [[nodiscard]] const std::string& name() const { return name_; }

private:
  std::string    name_;
  evp_md_ctx_st* ctx_ = nullptr;
};

std::string to_hex(const unsigned char* bytes, std::size_t size);

// resolve requested names into accumulators. Unknown names are logged as warnings and skipped,
// repeated names are only computed once.
std::vector<checksum> make_checksums(const std::vector<std::string>& algorithms,
                                     const logger&                   log);

} // namespace chunkdl

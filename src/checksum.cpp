#include "checksum.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fmt/format.h>
#include <iterator>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace chunkdl {

namespace {

std::string openssl_error(const std::string& what) {
  std::string         buffer(256, '\0');
  const unsigned long err = ERR_get_error();
  if (err == 0) {
    return fmt::format("{}: OpenSSL error (no queued error)", what);
  }
  ERR_error_string_n(err, buffer.data(), buffer.size());
  buffer.resize(buffer.find('\0'));
  return fmt::format("{}: {}", what, buffer);
}

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return str;
}

std::string to_upper(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return str;
}

} // namespace

checksum::checksum(const std::string& algorithm) : name_(to_upper(algorithm)) {
  const EVP_MD* md = EVP_get_digestbyname(to_lower(algorithm).c_str());
  if (md == nullptr) {
    throw std::runtime_error(fmt::format("unsupported hash type {}", algorithm));
  }

  ctx_ = EVP_MD_CTX_new();
  if (ctx_ == nullptr) {
    throw std::runtime_error(openssl_error("EVP_MD_CTX_new failed"));
  }

  // can fail for digests which exist by name but are not provided (eg md4 on openssl 3)
  if (EVP_DigestInit_ex(ctx_, md, nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    ctx_ = nullptr;
    throw std::runtime_error(
        openssl_error(fmt::format("cannot initialise hash type {}", algorithm)));
  }
}

checksum::checksum(checksum&& other) noexcept
    : name_(std::move(other.name_)), ctx_(std::exchange(other.ctx_, nullptr)) {}

checksum& checksum::operator=(checksum&& rhs) noexcept {
  if (this != &rhs) {
    EVP_MD_CTX_free(ctx_);
    name_ = std::move(rhs.name_);
    ctx_  = std::exchange(rhs.ctx_, nullptr);
  }
  return *this;
}

checksum::~checksum() { EVP_MD_CTX_free(ctx_); }

void checksum::update(const char* data, std::size_t size) {
  if (size == 0) return;
  if (EVP_DigestUpdate(ctx_, data, size) != 1) {
    throw std::runtime_error(openssl_error(fmt::format("{}: EVP_DigestUpdate failed", name_)));
  }
}

std::string checksum::hexdigest() const {
  // finalise a copy, so the running state remains usable
  EVP_MD_CTX* tmp = EVP_MD_CTX_new();
  if (tmp == nullptr || EVP_MD_CTX_copy_ex(tmp, ctx_) != 1) {
    EVP_MD_CTX_free(tmp);
    throw std::runtime_error(openssl_error(fmt::format("{}: EVP_MD_CTX_copy_ex failed", name_)));
  }

  std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
  unsigned int               len = 0;
  const int                  ok  = EVP_DigestFinal_ex(tmp, digest.data(), &len);
  EVP_MD_CTX_free(tmp);
  if (ok != 1) {
    throw std::runtime_error(openssl_error(fmt::format("{}: EVP_DigestFinal_ex failed", name_)));
  }
  return to_hex(digest.data(), len);
}

std::string to_hex(const unsigned char* bytes, std::size_t size) {
  std::string hex;
  hex.reserve(size * 2);
  for (std::size_t i = 0; i != size; ++i) {
    fmt::format_to(std::back_inserter(hex), "{:02x}", bytes[i]); // NOLINT ptr arith
  }
  return hex;
}

std::vector<checksum> make_checksums(const std::vector<std::string>& algorithms,
                                     const logger&                   log) {
  std::vector<checksum> checksums;
  for (const auto& algorithm: algorithms) {
    if (std::any_of(checksums.begin(), checksums.end(),
                    [&](const checksum& cs) { return cs.name() == to_upper(algorithm); })) {
      log.debug("{} checksum requested more than once", to_upper(algorithm));
      continue;
    }
    try {
      checksums.emplace_back(algorithm);
    } catch (const std::runtime_error& e) {
      log.warning("{}", e.what());
    }
  }
  return checksums;
}

} // namespace chunkdl

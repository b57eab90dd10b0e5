#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st; // OpenSSL EVP_MD_CTX

namespace lfsync {

// Raw 32-byte SHA-256 digest (binary, not hex)
using digest = std::array<std::uint8_t, 32>;

/**
 * Incremental SHA-256 over OpenSSL's EVP API.
 * Feed any number of chunks with update(), then call finish() once.
 */
class Sha256 {
public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256 &) = delete;
  auto operator=(const Sha256 &) -> Sha256 & = delete;

  void update(std::span<const std::uint8_t> data);
  void update(std::string_view s) {
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()),
                                         s.size()));
  }
  [[nodiscard]] auto finish() -> digest;

private:
  evp_md_ctx_st *ctx_{nullptr};
  bool finished_{false};
};

// One-shot SHA-256 of arbitrary bytes.
digest sha256(std::span<const std::uint8_t> data);

inline digest sha256(std::string_view s) {
  return sha256(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Convert binary digest to 64-char lowercase hex. */
std::string to_hex(const digest &d);

/**
 * Stream a file through SHA-256 in fixed-size chunks and return the
 * tagged form "sha256:<64 hex>". Memory use does not grow with file size.
 * Throws std::runtime_error if the file cannot be read.
 */
std::string hash_file(const std::filesystem::path &p);

// "sha256:<hex>" -> "<hex>" (unchanged if the prefix is missing)
std::string_view strip_hash_prefix(std::string_view tagged);

} // namespace lfsync

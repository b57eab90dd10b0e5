#include "lfsync/hash.hpp"
#include "lfsync/consts.hpp"

#include <cstdint>
#include <fstream>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lfsync {

Sha256::Sha256() : ctx_{EVP_MD_CTX_new()} {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    ctx_ = nullptr;
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha256) failed");
  }
}

Sha256::~Sha256() {
  if (ctx_) {
    EVP_MD_CTX_free(ctx_);
  }
}

void Sha256::update(std::span<const std::uint8_t> data) {
  if (finished_) {
    throw std::logic_error("Sha256::update after finish");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

auto Sha256::finish() -> digest {
  if (finished_) {
    throw std::logic_error("Sha256::finish called twice");
  }
  finished_ = true;

  digest out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  if (len != out.size()) {
    throw std::runtime_error("SHA-256 produced unexpected length");
  }
  return out;
}

digest sha256(std::span<const std::uint8_t> data) {
  Sha256 h;
  h.update(data);
  return h.finish();
}

std::string to_hex(const digest &d) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(consts::kSha256HexLen);
  for (std::size_t i = 0; i < consts::kSha256RawLen; ++i) {
    unsigned b = d[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

std::string hash_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for hashing failed: " + p.string());
  }
  Sha256 h;
  std::vector<char> buf(consts::kHashChunk);
  while (ifs) {
    ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto n = ifs.gcount();
    if (n > 0) {
      h.update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(buf.data()),
                                             static_cast<std::size_t>(n)));
    }
  }
  if (ifs.bad()) {
    throw std::runtime_error("read failed while hashing: " + p.string());
  }
  return std::string(consts::kHashPrefix) + to_hex(h.finish());
}

std::string_view strip_hash_prefix(std::string_view tagged) {
  if (tagged.starts_with(consts::kHashPrefix)) {
    tagged.remove_prefix(consts::kHashPrefix.size());
  }
  return tagged;
}

} // namespace lfsync

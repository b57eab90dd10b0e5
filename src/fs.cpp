#include "lfsync/fs.hpp"

#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace lfsync::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

bool is_regular_file(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_regular_file(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  if (!p.has_parent_path())
    return;
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  return buf;
}

std::string read_text(const std::filesystem::path &p) {
  const auto bytes = read_file(p);
  return std::string(bytes.begin(), bytes.end());
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  const auto tmp = temp_path_beside(p);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs) {
      remove_quietly(tmp);
      throw std::runtime_error("flush temp failed: " + tmp.string());
    }
  }
  try {
    replace_file(tmp, p);
  } catch (...) {
    remove_quietly(tmp);
    throw;
  }
}

void write_text_atomic(const std::filesystem::path &p, std::string_view text) {
  write_file_atomic(p, std::span<const std::uint8_t>(
                           reinterpret_cast<const std::uint8_t *>(text.data()), text.size()));
}

std::filesystem::path temp_path_beside(const std::filesystem::path &p) {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::ostringstream os;
  os << std::hex << rng();
  auto tmp = p;
  tmp += ".lfsync-" + os.str() + ".tmp";
  return tmp;
}

void remove_quietly(const std::filesystem::path &p) noexcept {
  std::error_code ec;
  std::filesystem::remove(p, ec);
}

void replace_file(const std::filesystem::path &src, const std::filesystem::path &dst) {
  std::error_code ec;
  std::filesystem::rename(src, dst, ec);
  if (ec) {
    std::filesystem::remove(dst, ec);
    std::filesystem::rename(src, dst, ec);
    if (ec) {
      throw std::runtime_error("atomic replace failed: " + dst.string() + ": " + ec.message());
    }
  }
}

std::string relative_generic(const std::filesystem::path &p, const std::filesystem::path &root) {
  return p.lexically_normal().lexically_relative(root.lexically_normal()).generic_string();
}

} // namespace lfsync::fs

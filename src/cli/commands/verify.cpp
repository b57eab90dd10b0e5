#include "lfsync/error.hpp"
#include "lfsync/hash.hpp"
#include "lfsync/pointer.hpp"

#include <filesystem>
#include <iostream>

int cmd_verify(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: lfsync verify <pointer>...\n";
    return 2;
  }
  int bad = 0;
  for (int i = 1; i < argc; ++i) {
    const std::filesystem::path p = argv[i];
    try {
      const auto pointer = lfsync::read_pointer(p);
      if (!lfsync::validate(pointer)) {
        std::cout << "INVALID   " << p.string() << "\n";
        ++bad;
        continue;
      }
      const auto real = lfsync::real_path_for(p);
      if (real == p || !std::filesystem::exists(real)) {
        std::cout << "MISSING   " << real.string() << "\n";
        ++bad;
      } else if (lfsync::hash_file(real) != pointer.hash) {
        std::cout << "MISMATCH  " << real.string() << "\n";
        ++bad;
      } else {
        std::cout << "OK        " << real.string() << "  " << pointer.asset_name << "\n";
      }
    } catch (const std::exception &e) {
      std::cerr << "verify: " << p.string() << ": " << e.what() << "\n";
      ++bad;
    }
  }
  return bad == 0 ? 0 : 1;
}

#include "vbranch/error.hpp"
#include "vbranch/store.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

int main() {
  const fs::path root = fs::temp_directory_path() /
                        ("vbranch_directory_store_" + std::to_string(std::random_device{}()));

  try {
    vbranch::DirectoryStore store{root};
    if (store.read("meta/name")) {
      std::cerr << "read from an empty store returned content\n";
      return 1;
    }

    store.apply({{.key = "id", .value = vbranch::Content::utf8("abc")},
                 {.key = "meta/name", .value = vbranch::Content::utf8("Virtual branch")},
                 {.key = "meta/notes", .value = vbranch::Content::utf8("")},
                 {.key = "meta/blob", .value = vbranch::Content::binary({0xFF, 0x00, 0x01})}});

    // one file per key, nested keys in subdirectories, no trailing newline
    if (slurp(root / "meta" / "name") != "Virtual branch" || slurp(root / "id") != "abc") {
      std::cerr << "unexpected file contents\n";
      return 1;
    }
    if (fs::exists(root / "meta" / "name.tmp")) {
      std::cerr << "temp file left behind\n";
      return 1;
    }

    const auto notes = store.read("meta/notes");
    if (!notes || !notes->is_utf8() || !notes->as_text().empty()) {
      std::cerr << "empty value did not read back as empty text\n";
      return 1;
    }
    const auto blob = store.read("meta/blob");
    if (!blob || blob->is_utf8() || blob->bytes() != vbranch::Content::Bytes{0xFF, 0x00, 0x01}) {
      std::cerr << "binary value did not read back as binary\n";
      return 1;
    }

    // removal, including of keys that never existed
    store.apply({{.key = "meta/notes", .value = std::nullopt},
                 {.key = "meta/absent", .value = std::nullopt}});
    if (store.read("meta/notes") || fs::exists(root / "meta" / "notes")) {
      std::cerr << "removed key still present\n";
      return 1;
    }

    for (const std::string bad : {"", "/etc/passwd", "../escape", "meta//name", "meta/./name"}) {
      try {
        (void)store.read(bad);
        std::cerr << "accepted key [" << bad << "]\n";
        return 1;
      } catch (const vbranch::StoreError &e) {
        if (e.kind() != vbranch::ErrorKind::store) {
          std::cerr << "wrong kind\n";
          return 1;
        }
      }
    }

    // a directory where a value is expected is a store failure, not "not found"
    fs::create_directories(root / "meta" / "dir_value" / "x");
    try {
      (void)store.read("meta/dir_value");
      std::cerr << "read a directory as a value\n";
      return 1;
    } catch (const vbranch::StoreError &) {
      // expected
    }

    std::cout << "directory_store OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}

#include "vbranch/fs.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace vbranch::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + p.parent_path().string() + ": " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p, ec)) {
    throw std::runtime_error("not a regular file: " + p.string());
  }
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  std::vector<std::uint8_t> buf{std::istreambuf_iterator<char>(ifs),
                                std::istreambuf_iterator<char>()};
  if (ifs.bad()) {
    throw std::runtime_error("read failed: " + p.string());
  }
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
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
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    // `p` keeps its previous content; only the temp file is discarded
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("atomic replace failed: " + p.string() + ": " + ec.message());
  }
}

bool remove_file(const std::filesystem::path &p) {
  std::error_code ec;
  const bool removed = std::filesystem::remove(p, ec);
  if (ec)
    throw std::runtime_error("remove failed: " + p.string() + ": " + ec.message());
  return removed;
}

std::vector<std::string> list_dirs(const std::filesystem::path &dir) {
  std::vector<std::string> out;
  if (!fs::exists(dir))
    return out;
  std::error_code ec;
  for (const auto &entry : std::filesystem::directory_iterator(dir, ec)) {
    if (entry.is_directory(ec))
      out.push_back(entry.path().filename().string());
  }
  if (ec)
    throw std::runtime_error("list failed: " + dir.string() + ": " + ec.message());
  std::ranges::sort(out);
  return out;
}

} // namespace vbranch::fs

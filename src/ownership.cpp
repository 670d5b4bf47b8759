#include "vbranch/ownership.hpp"

#include "vbranch/consts.hpp"
#include "vbranch/error.hpp"
#include "vbranch/util.hpp"

#include <algorithm>
#include <limits>

namespace vbranch {

// Hunk

Hunk::Hunk(std::uint32_t start, std::uint32_t end, std::optional<Oid> hash,
           std::optional<std::uint64_t> timestamp_ms)
    : start_(start), end_(end), hash_(hash), timestamp_ms_(timestamp_ms) {
  if (end < start) {
    throw InvalidRange(start, end);
  }
}

Hunk Hunk::parse(std::string_view text) {
  const auto fields = strutil::split(text, consts::kFieldSep);
  if (fields.size() < 2 || fields.size() > 4) {
    throw OwnershipParseError(std::string(text), "expected start-end[-hash[-timestamp]]");
  }

  auto line_number = [&](std::string_view field) -> std::uint32_t {
    std::uint64_t value = 0;
    if (!strutil::parse_u64(field, value) || value > std::numeric_limits<std::uint32_t>::max()) {
      throw OwnershipParseError(std::string(text), "invalid line number");
    }
    return static_cast<std::uint32_t>(value);
  };
  const std::uint32_t start = line_number(fields[0]);
  const std::uint32_t end = line_number(fields[1]);
  if (end < start) {
    throw OwnershipParseError(std::string(text), "end before start");
  }

  std::optional<Oid> hash;
  if (fields.size() > 2 && !fields[2].empty()) {
    digest bytes{};
    if (!from_hex(fields[2], bytes)) {
      throw OwnershipParseError(std::string(text), "invalid hunk hash");
    }
    hash = Oid{bytes};
  }

  std::optional<std::uint64_t> timestamp_ms;
  if (fields.size() > 3) {
    std::uint64_t ts = 0;
    if (!strutil::parse_u64(fields[3], ts)) {
      throw OwnershipParseError(std::string(text), "invalid hunk timestamp");
    }
    timestamp_ms = ts;
  }
  return Hunk{start, end, hash, timestamp_ms};
}

std::string Hunk::to_string() const {
  std::string s = std::to_string(start_) + consts::kFieldSep + std::to_string(end_);
  if (hash_ || timestamp_ms_) {
    s += consts::kFieldSep;
    if (hash_)
      s += hash_->to_string();
  }
  if (timestamp_ms_) {
    s += consts::kFieldSep;
    s += std::to_string(*timestamp_ms_);
  }
  return s;
}

// FileOwnership

namespace {

// The text form has one file per line, so a path may not hold a line break.
void check_path(const std::string &path) {
  if (path.empty()) {
    throw OwnershipParseError(path, "empty path");
  }
  if (path.find(consts::kLF) != std::string::npos) {
    throw OwnershipParseError(path, "line break in path");
  }
}

} // namespace

FileOwnership::FileOwnership(std::string path) : path_(std::move(path)) { check_path(path_); }

FileOwnership::FileOwnership(std::string path, const std::vector<Hunk> &hunks)
    : FileOwnership(std::move(path)) {
  for (const auto &h : hunks)
    add(h);
}

FileOwnership FileOwnership::parse(std::string_view text) {
  const auto sep = text.rfind(consts::kPathSep);
  if (sep == std::string_view::npos) {
    throw OwnershipParseError(std::string(text), "missing ':' between path and hunks");
  }
  // the path is taken verbatim; only hunk pieces are trimmed
  const auto path = text.substr(0, sep);
  if (path.empty()) {
    throw OwnershipParseError(std::string(text), "empty path");
  }

  FileOwnership out{std::string(path)};
  for (const auto piece : strutil::split(text.substr(sep + 1), consts::kHunkSep)) {
    const auto hunk_text = strutil::trim(piece);
    if (hunk_text.empty()) {
      throw OwnershipParseError(std::string(text), "empty hunk");
    }
    out.add(Hunk::parse(hunk_text));
  }
  return out;
}

void FileOwnership::add(const Hunk &hunk) {
  std::erase_if(hunks_, [&](const Hunk &h) { return h.overlaps(hunk); });
  const auto at = std::ranges::lower_bound(hunks_, hunk.start(), {}, &Hunk::start);
  hunks_.insert(at, hunk);
}

bool FileOwnership::remove(const Hunk &hunk) {
  const auto it = std::ranges::find_if(hunks_, [&](const Hunk &h) { return h.same_range(hunk); });
  if (it == hunks_.end()) {
    return false;
  }
  hunks_.erase(it);
  return true;
}

bool FileOwnership::contains(const Hunk &hunk) const {
  return std::ranges::any_of(hunks_, [&](const Hunk &h) { return h.same_range(hunk); });
}

std::string FileOwnership::to_string() const {
  std::string s = path_;
  s += consts::kPathSep;
  for (std::size_t i = 0; i < hunks_.size(); ++i) {
    if (i > 0)
      s += consts::kHunkSep;
    s += hunks_[i].to_string();
  }
  return s;
}

// Ownership

Ownership Ownership::parse(std::string_view text) {
  Ownership out;
  for (const auto line : strutil::split(text, consts::kLF)) {
    if (strutil::trim(line).empty())
      continue;
    out.put(FileOwnership::parse(line));
  }
  return out;
}

void Ownership::add(const std::string &path, const Hunk &hunk) {
  files_.try_emplace(path, path).first->second.add(hunk);
}

void Ownership::put(const FileOwnership &file) {
  for (const auto &h : file.hunks())
    add(file.path(), h);
}

bool Ownership::remove(const std::string &path, const Hunk &hunk) {
  const auto it = files_.find(path);
  if (it == files_.end() || !it->second.remove(hunk)) {
    return false;
  }
  if (it->second.empty())
    files_.erase(it);
  return true;
}

FileOwnership Ownership::take(const std::string &path) {
  auto node = files_.extract(path);
  if (node.empty()) {
    return FileOwnership{path};
  }
  return std::move(node.mapped());
}

bool Ownership::contains(const std::string &path) const { return files_.contains(path); }

const FileOwnership *Ownership::find(const std::string &path) const {
  const auto it = files_.find(path);
  return it == files_.end() ? nullptr : &it->second;
}

std::string Ownership::to_string() const {
  std::string s;
  for (const auto &[path, file] : files_) {
    if (!s.empty())
      s += consts::kLF;
    s += file.to_string();
  }
  return s;
}

} // namespace vbranch

#include "vbranch/store.hpp"

#include "vbranch/consts.hpp"
#include "vbranch/error.hpp"
#include "vbranch/fs.hpp"
#include "vbranch/util.hpp"

#include <stdexcept>

namespace vbranch {

// Content

Content Content::from_bytes(std::span<const std::uint8_t> bytes) {
  if (vbranch::is_utf8(bytes)) {
    return utf8(std::string(bytes.begin(), bytes.end()));
  }
  return binary(Bytes(bytes.begin(), bytes.end()));
}

Content::Bytes Content::bytes() const {
  if (const auto *text = std::get_if<std::string>(&value_)) {
    return {text->begin(), text->end()};
  }
  return std::get<Bytes>(value_);
}

const std::string &Content::as_text() const {
  const auto *text = std::get_if<std::string>(&value_);
  if (!text) {
    throw Error(ErrorKind::content_mismatch, "expected utf-8 text, found binary content");
  }
  return *text;
}

bool Content::as_bool() const {
  const auto &text = as_text();
  if (text == consts::kTrue)
    return true;
  if (text == consts::kFalse)
    return false;
  throw Error(ErrorKind::content_mismatch, "expected boolean, found '" + text + "'");
}

std::uint64_t Content::as_u64() const {
  const auto &text = as_text();
  std::uint64_t value = 0;
  if (!strutil::parse_u64(text, value)) {
    throw Error(ErrorKind::content_mismatch, "expected unsigned integer, found '" + text + "'");
  }
  return value;
}

// MemoryStore

std::optional<Content> MemoryStore::read(std::string_view key) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryStore::apply(const std::vector<WriteOp> &batch) {
  auto next = entries_;
  for (const auto &op : batch) {
    if (op.value) {
      next.insert_or_assign(op.key, *op.value);
    } else {
      next.erase(op.key);
    }
  }
  entries_.swap(next);
}

// DirectoryStore

std::filesystem::path DirectoryStore::key_path(std::string_view key) const {
  const auto parts = strutil::split(key, '/');
  for (const auto part : parts) {
    if (part.empty() || part == "." || part == "..") {
      throw StoreError("invalid key '" + std::string(key) + "'");
    }
  }
  return root_ / std::filesystem::path(key);
}

std::optional<Content> DirectoryStore::read(std::string_view key) const {
  const auto p = key_path(key);
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  try {
    return Content::from_bytes(fs::read_file(p));
  } catch (const std::runtime_error &e) {
    throw StoreError(std::string(key) + ": " + e.what());
  }
}

void DirectoryStore::apply(const std::vector<WriteOp> &batch) {
  for (const auto &op : batch) {
    const auto p = key_path(op.key);
    try {
      if (op.value) {
        fs::write_file_atomic(p, op.value->bytes());
      } else {
        fs::remove_file(p);
      }
    } catch (const std::runtime_error &e) {
      throw StoreError(op.key + ": " + e.what());
    }
  }
}

} // namespace vbranch

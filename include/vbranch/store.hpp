#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace vbranch {

// A stored value: UTF-8 text or opaque bytes. Conversions never coerce; a
// shape mismatch throws Error(ErrorKind::content_mismatch).
class Content {
public:
  using Bytes = std::vector<std::uint8_t>;

  static auto utf8(std::string text) -> Content { return Content{std::move(text)}; }
  static auto binary(Bytes bytes) -> Content { return Content{std::move(bytes)}; }
  // Text when the bytes validate as UTF-8, binary otherwise.
  static auto from_bytes(std::span<const std::uint8_t> bytes) -> Content;

  [[nodiscard]] bool is_utf8() const { return std::holds_alternative<std::string>(value_); }
  [[nodiscard]] auto bytes() const -> Bytes;

  [[nodiscard]] auto as_text() const -> const std::string &;
  [[nodiscard]] auto as_bool() const -> bool;
  [[nodiscard]] auto as_u64() const -> std::uint64_t;

  auto operator==(const Content &) const -> bool = default;

private:
  explicit Content(std::string text) : value_(std::move(text)) {}
  explicit Content(Bytes bytes) : value_(std::move(bytes)) {}

  std::variant<std::string, Bytes> value_;
};

// Key-addressed read access to one record.
class Reader {
public:
  virtual ~Reader() = default;

  // std::nullopt when the key does not exist; StoreError on I/O failure.
  [[nodiscard]] virtual std::optional<Content> read(std::string_view key) const = 0;
};

struct WriteOp {
  std::string key;
  std::optional<Content> value; // std::nullopt removes the key
};

class Writer {
public:
  virtual ~Writer() = default;

  // Apply all operations in order. StoreError on failure.
  virtual void apply(const std::vector<WriteOp> &batch) = 0;
};

// In-process store; a batch is applied all-or-nothing.
class MemoryStore : public Reader, public Writer {
public:
  [[nodiscard]] std::optional<Content> read(std::string_view key) const override;
  void apply(const std::vector<WriteOp> &batch) override;

  void set(const std::string &key, Content value) { entries_.insert_or_assign(key, std::move(value)); }
  void erase(const std::string &key) { entries_.erase(key); }
  [[nodiscard]] const std::map<std::string, Content, std::less<>> &entries() const {
    return entries_;
  }

private:
  std::map<std::string, Content, std::less<>> entries_;
};

/**
 * One file per key below `root` (key "meta/name" -> root/meta/name).
 * Each file is replaced atomically (temp file + rename), but a batch is not:
 * if the filesystem fails part way, keys written before the failure stay
 * written and StoreError is thrown. Re-applying the same batch is safe.
 */
class DirectoryStore : public Reader, public Writer {
public:
  explicit DirectoryStore(std::filesystem::path root) : root_(std::move(root)) {}

  [[nodiscard]] std::optional<Content> read(std::string_view key) const override;
  void apply(const std::vector<WriteOp> &batch) override;

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

private:
  [[nodiscard]] auto key_path(std::string_view key) const -> std::filesystem::path;

  std::filesystem::path root_;
};

} // namespace vbranch

#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace vbranch {

// Raw 20-byte SHA-1 digest (binary, not hex)
using digest = std::array<std::uint8_t, 20>;

/**
 * Parse 40-char hex into a binary digest.
 * Returns false if length/characters are invalid.
 */
bool from_hex(std::string_view hex, digest &out);

/** Convert a binary digest to 40-char lowercase hex. */
std::string to_hex(const digest &bytes);

/**
 * Object id of a tree or commit. The core never resolves it against an
 * object database; it only parses and prints the hex form.
 */
class Oid {
public:
  Oid() = default;
  explicit Oid(const digest &bytes) : bytes_(bytes) {}

  // Throws Error(ErrorKind::invalid) unless `hex` is exactly 40 hex digits.
  static auto parse(std::string_view hex) -> Oid;

  [[nodiscard]] auto to_string() const -> std::string { return to_hex(bytes_); }
  [[nodiscard]] const digest &bytes() const { return bytes_; }

  auto operator<=>(const Oid &) const = default;
  auto operator==(const Oid &) const -> bool = default;

private:
  digest bytes_{};
};

// SHA-1 of arbitrary bytes.
Oid sha1(std::span<const std::uint8_t> data);

inline Oid sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

// Content fingerprint of a hunk: SHA-1 over its diff text.
inline Oid fingerprint(std::string_view diff) { return sha1(diff); }

} // namespace vbranch

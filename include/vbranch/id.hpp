#pragma once
#include "vbranch/consts.hpp"
#include "vbranch/error.hpp"

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <cctype>
#include <compare>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vbranch {

// Canonical 8-4-4-4-12 hex layout; braces and dashless forms are rejected.
inline auto is_canonical_uuid(std::string_view text) -> bool {
  if (text.size() != consts::kIdTextLen) {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    const bool dash_slot = i == 8 || i == 13 || i == 18 || i == 23;
    if (dash_slot ? text[i] != '-' : !std::isxdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
  }
  return true;
}

/**
 * A UUID tagged with the kind of record it identifies, so that
 * Id<Branch> and Id<Session> never convert into each other.
 */
template <typename Tag> class Id {
public:
  Id() = default;

  static auto generate() -> Id {
    static boost::uuids::random_generator generator;
    return Id{generator()};
  }

  static auto parse(std::string_view text) -> Id {
    if (!is_canonical_uuid(text)) {
      throw MalformedIdentifier(std::string(text));
    }
    try {
      return Id{boost::uuids::string_generator{}(text.begin(), text.end())};
    } catch (const std::runtime_error &) {
      throw MalformedIdentifier(std::string(text));
    }
  }

  [[nodiscard]] auto to_string() const -> std::string { return boost::uuids::to_string(uuid_); }
  [[nodiscard]] auto uuid() const -> const boost::uuids::uuid & { return uuid_; }

  auto operator==(const Id &) const -> bool = default;
  auto operator<=>(const Id &other) const -> std::strong_ordering {
    if (uuid_ < other.uuid_)
      return std::strong_ordering::less;
    if (other.uuid_ < uuid_)
      return std::strong_ordering::greater;
    return std::strong_ordering::equal;
  }

private:
  explicit Id(const boost::uuids::uuid &uuid) : uuid_(uuid) {}

  boost::uuids::uuid uuid_{};
};

} // namespace vbranch

template <typename Tag> struct std::hash<vbranch::Id<Tag>> {
  auto operator()(const vbranch::Id<Tag> &id) const noexcept -> std::size_t {
    // FNV-1a over the 16 bytes
    auto h = std::size_t{14695981039346656037ULL};
    for (const auto b : id.uuid()) {
      h ^= static_cast<std::size_t>(b);
      h *= std::size_t{1099511628211ULL};
    }
    return h;
  }
};

#include "vbranch/branch.hpp"

#include "vbranch/consts.hpp"
#include "vbranch/error.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace vbranch {

namespace {

namespace keys = consts::keys;

enum class Policy : std::uint8_t {
  required, // absent -> not_found, malformed -> invalid
  optional, // absent -> default, malformed -> invalid
  lenient,  // any failure -> default
  tristate, // absent or not text -> unset, text that does not parse -> invalid
};

// `fallback` is the stored text an absent optional key or an unreadable
// lenient key stands for. Tri-state keys fall back to unset.
struct Field {
  std::string_view key;
  Policy policy;
  std::string_view fallback;
};

constexpr std::array kFields = {
    Field{keys::kId, Policy::required, {}},
    Field{keys::kName, Policy::required, {}},
    Field{keys::kNotes, Policy::optional, ""},
    Field{keys::kApplied, Policy::lenient, consts::kFalse},
    Field{keys::kOrder, Policy::optional, "0"},
    Field{keys::kUpstreamHead, Policy::tristate, {}},
    Field{keys::kUpstream, Policy::tristate, {}},
    Field{keys::kTree, Policy::required, {}},
    Field{keys::kHead, Policy::required, {}},
    Field{keys::kCreated, Policy::required, {}},
    Field{keys::kUpdated, Policy::required, {}},
    Field{keys::kOwnership, Policy::required, {}},
};

auto field(std::string_view key) -> const Field & {
  for (const auto &f : kFields) {
    if (f.key == key)
      return f;
  }
  throw std::logic_error("no such branch field: " + std::string(key));
}

template <typename T, typename Parse>
auto load_field(const Reader &reader, std::string_view key, Parse parse) -> T {
  const Field &f = field(key);
  auto fallback = [&]() -> T {
    if (f.policy == Policy::tristate)
      return T{};
    return parse(Content::utf8(std::string(f.fallback)));
  };

  std::optional<Content> content;
  try {
    content = reader.read(f.key);
  } catch (const StoreError &) {
    if (f.policy != Policy::lenient)
      throw;
    return fallback();
  }

  if (!content) {
    if (f.policy == Policy::required)
      throw LoadError::not_found(std::string(f.key));
    return fallback();
  }
  if (f.policy == Policy::tristate && !content->is_utf8()) {
    return fallback();
  }

  try {
    return parse(*content);
  } catch (const Error &e) {
    if (f.policy == Policy::lenient)
      return fallback();
    throw LoadError::invalid(std::string(f.key), e);
  }
}

auto text(const Content &c) -> std::string { return c.as_text(); }
auto number(const Content &c) -> std::uint64_t { return c.as_u64(); }
auto oid(const Content &c) -> Oid { return Oid::parse(c.as_text()); }

} // namespace

Branch Branch::load(const Reader &reader) {
  Branch b;
  b.id = load_field<BranchId>(reader, keys::kId,
                              [](const Content &c) { return BranchId::parse(c.as_text()); });
  b.name = load_field<std::string>(reader, keys::kName, text);
  b.notes = load_field<std::string>(reader, keys::kNotes, text);
  b.applied = load_field<bool>(reader, keys::kApplied, [](const Content &c) { return c.as_bool(); });
  b.order = load_field<std::size_t>(reader, keys::kOrder, [](const Content &c) {
    return static_cast<std::size_t>(c.as_u64());
  });
  b.upstream_head = load_field<std::optional<Oid>>(
      reader, keys::kUpstreamHead,
      [](const Content &c) -> std::optional<Oid> { return Oid::parse(c.as_text()); });
  b.upstream = load_field<std::optional<RemoteRefname>>(
      reader, keys::kUpstream, [](const Content &c) -> std::optional<RemoteRefname> {
        const auto &s = c.as_text();
        if (s.empty())
          return std::nullopt;
        return RemoteRefname::parse(s);
      });
  b.tree = load_field<Oid>(reader, keys::kTree, oid);
  b.head = load_field<Oid>(reader, keys::kHead, oid);
  b.created_timestamp_ms = load_field<std::uint64_t>(reader, keys::kCreated, number);
  b.updated_timestamp_ms = load_field<std::uint64_t>(reader, keys::kUpdated, number);
  b.ownership = load_field<Ownership>(reader, keys::kOwnership,
                                      [](const Content &c) { return Ownership::parse(c.as_text()); });
  return b;
}

} // namespace vbranch

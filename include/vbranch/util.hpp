#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vbranch {

// Validate UTF-8 (rejects overlong forms, surrogates and code points > U+10FFFF)
auto is_utf8(std::span<const std::uint8_t> bytes) -> bool;

// String helpers
namespace strutil {
  // Strip leading/trailing spaces, tabs, CR and LF
  auto trim(std::string_view str) -> std::string_view;

  // Split on every occurrence of `sep`; "a,,b" yields {"a", "", "b"}
  auto split(std::string_view str, char sep) -> std::vector<std::string_view>;

  // Plain unsigned decimal: digits only, no sign, no whitespace, no overflow
  auto parse_u64(std::string_view str, std::uint64_t& out) -> bool;

  inline auto as_bytes(std::string_view str) -> std::span<const std::uint8_t> {
    return {reinterpret_cast<const std::uint8_t*>(str.data()), str.size()};
  }
}

}

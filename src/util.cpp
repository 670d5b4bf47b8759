// Text helpers shared by the parsers and the stores
#include "vbranch/util.hpp"

#include <algorithm>
#include <charconv>

namespace vbranch {

bool is_utf8(std::span<const std::uint8_t> bytes) {
  std::size_t i = 0;
  while (i < bytes.size()) {
    const std::uint8_t lead = bytes[i];
    std::size_t extra = 0;
    std::uint32_t cp = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    }
    if ((lead & 0xE0) == 0xC0) {
      extra = 1;
      cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
      cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      extra = 3;
      cp = lead & 0x07;
    } else {
      return false;
    }
    if (i + extra >= bytes.size()) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const std::uint8_t cont = bytes[i + k];
      if ((cont & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cont & 0x3F);
    }
    // overlong encodings, UTF-16 surrogates, beyond Unicode
    static constexpr std::uint32_t kMin[] = {0, 0x80, 0x800, 0x10000};
    if (cp < kMin[extra] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

namespace strutil {

std::string_view trim(std::string_view str) {
  auto blank = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!str.empty() && blank(str.front()))
    str.remove_prefix(1);
  while (!str.empty() && blank(str.back()))
    str.remove_suffix(1);
  return str;
}

std::vector<std::string_view> split(std::string_view str, char sep) {
  std::vector<std::string_view> out;
  std::size_t pos = 0;
  while (true) {
    const auto next = str.find(sep, pos);
    if (next == std::string_view::npos) {
      out.push_back(str.substr(pos));
      return out;
    }
    out.push_back(str.substr(pos, next - pos));
    pos = next + 1;
  }
}

bool parse_u64(std::string_view str, std::uint64_t &out) {
  if (str.empty() || !std::ranges::all_of(str, [](char c) { return c >= '0' && c <= '9'; })) {
    return false;
  }
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (ec != std::errc{} || ptr != str.data() + str.size()) {
    return false;
  }
  out = value;
  return true;
}

} // namespace strutil

} // namespace vbranch

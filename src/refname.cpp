#include "vbranch/refname.hpp"

#include "vbranch/consts.hpp"
#include "vbranch/error.hpp"

#include <algorithm>
#include <cctype>

namespace vbranch {

namespace {

constexpr std::string_view kForbidden = " ~^:?*[\\";
constexpr std::string_view kLockSuffix = ".lock";

bool forbidden_char(char c) {
  const auto uc = static_cast<unsigned char>(c);
  return uc < 0x20 || uc == 0x7f || kForbidden.find(c) != std::string_view::npos;
}

bool valid_component(std::string_view component) {
  if (component.empty() || component.front() == '.') {
    return false;
  }
  return !component.ends_with(kLockSuffix);
}

} // namespace

bool is_valid_branch_name(std::string_view name) {
  if (name.empty() || name == "@") {
    return false;
  }
  if (name.front() == '/' || name.back() == '/' || name.back() == '.') {
    return false;
  }
  if (name.find("..") != std::string_view::npos || name.find("@{") != std::string_view::npos) {
    return false;
  }
  if (std::ranges::any_of(name, forbidden_char)) {
    return false;
  }
  std::size_t pos = 0;
  while (pos <= name.size()) {
    const auto slash = name.find('/', pos);
    const auto end = slash == std::string_view::npos ? name.size() : slash;
    if (!valid_component(name.substr(pos, end - pos))) {
      return false;
    }
    if (slash == std::string_view::npos) {
      break;
    }
    pos = slash + 1;
  }
  return true;
}

bool is_valid_remote_name(std::string_view name) {
  return name.find('/') == std::string_view::npos && is_valid_branch_name(name);
}

std::string normalize_branch_name(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  for (const char c : name) {
    const char mapped =
        std::isspace(static_cast<unsigned char>(c)) != 0 || forbidden_char(c) ? '-' : c;
    const char prev = out.empty() ? '\0' : out.back();
    if (mapped == '-' && (prev == '-' || out.empty())) {
      continue;
    }
    if (mapped == '/' && (prev == '/' || prev == '.' || out.empty())) {
      continue;
    }
    if (mapped == '.' && (prev == '.' || prev == '/' || out.empty())) {
      continue;
    }
    if (mapped == '{' && prev == '@') {
      out.back() = '-';
    }
    out.push_back(mapped);
  }

  // ".lock" may not end any component
  for (auto at = out.find(".lock/"); at != std::string::npos; at = out.find(".lock/", at)) {
    out[at] = '-';
  }
  auto trim_tail = [&out] {
    while (!out.empty() && (out.back() == '-' || out.back() == '/' || out.back() == '.')) {
      out.pop_back();
    }
  };
  trim_tail();
  while (out.ends_with(kLockSuffix)) {
    out.resize(out.size() - kLockSuffix.size());
    trim_tail();
  }
  if (out == "@") {
    out.clear();
  }
  return out;
}

RemoteRefname RemoteRefname::parse(std::string_view text) {
  if (!text.starts_with(consts::kRemotesPrefix)) {
    throw Error(ErrorKind::invalid, "not a remote ref: '" + std::string(text) + "'");
  }
  const auto rest = text.substr(consts::kRemotesPrefix.size());
  const auto slash = rest.find('/');
  if (slash == std::string_view::npos || slash == 0) {
    throw Error(ErrorKind::invalid, "remote ref has no remote name: '" + std::string(text) + "'");
  }
  RemoteRefname out{.remote = std::string(rest.substr(0, slash)),
                    .branch = std::string(rest.substr(slash + 1))};
  if (!is_valid_remote_name(out.remote)) {
    throw Error(ErrorKind::invalid, "invalid remote name: '" + out.remote + "'");
  }
  if (!is_valid_branch_name(out.branch)) {
    throw Error(ErrorKind::invalid, "invalid branch name: '" + out.branch + "'");
  }
  return out;
}

std::string RemoteRefname::to_string() const {
  return std::string(consts::kRemotesPrefix) + remote + "/" + branch;
}

std::string VirtualRefname::to_string() const {
  return std::string(consts::kVirtualPrefix) + branch;
}

} // namespace vbranch

#pragma once
#include <string>
#include <string_view>

namespace vbranch {

// git check-ref-format rules applied to a single branch name (which may
// itself contain '/').
auto is_valid_branch_name(std::string_view name) -> bool;

// A remote name is a single component: a valid branch name without '/'.
auto is_valid_remote_name(std::string_view name) -> bool;

// Turn free text ("My new feature!") into a valid branch name ("My-new-feature").
// Returns an empty string when nothing usable is left.
auto normalize_branch_name(std::string_view name) -> std::string;

// "refs/remotes/<remote>/<branch>"
struct RemoteRefname {
  std::string remote;
  std::string branch;

  // Throws Error(ErrorKind::invalid) on anything that is not a remote ref.
  static auto parse(std::string_view text) -> RemoteRefname;

  [[nodiscard]] auto to_string() const -> std::string;

  auto operator==(const RemoteRefname &) const -> bool = default;
};

// "refs/gitbutler/<branch>" - a name for a virtual branch; no such ref exists
// in the repository.
struct VirtualRefname {
  std::string branch;

  [[nodiscard]] auto to_string() const -> std::string;

  auto operator==(const VirtualRefname &) const -> bool = default;
};

} // namespace vbranch

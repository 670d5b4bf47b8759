#pragma once
#include "vbranch/branch.hpp"
#include "vbranch/config.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace vbranch {

struct BranchCreateRequest {
  std::optional<std::string> name;
  std::optional<Ownership> ownership;
  std::optional<std::size_t> order;
};

// Sparse patch: std::nullopt leaves the field unchanged.
struct BranchUpdateRequest {
  BranchId id;
  std::optional<std::string> name;
  std::optional<std::string> notes;
  std::optional<Ownership> ownership;
  std::optional<std::size_t> order;
  std::optional<std::string> upstream; // just the branch name ("feature"), not "refs/remotes/origin/feature"
};

// Build a new, unapplied branch based on `tree`/`head`. The name (requested or
// config.default_branch_name) gets " 1", " 2", ... appended while it clashes
// with a name in `existing`; the order defaults to one past the highest
// existing order.
auto create_branch(const BranchCreateRequest& request, const Oid& tree, const Oid& head,
                   std::span<const Branch> existing, const Config& config,
                   std::uint64_t now_ms) -> Branch;

// Patch `branch` in place and refresh updated_timestamp_ms. The upstream short
// name is qualified as refs/remotes/<config.remote_name>/<name>. On any
// exception `branch` is left unchanged.
void apply_update(Branch& branch, const BranchUpdateRequest& request, const Config& config,
                  std::uint64_t now_ms);

} // namespace vbranch

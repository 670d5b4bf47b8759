#include "vbranch/request.hpp"

#include "vbranch/error.hpp"
#include "vbranch/refname.hpp"

#include <algorithm>
#include <utility>

namespace vbranch {

namespace {

std::string dedup_name(const std::string &base, std::span<const Branch> existing) {
  auto taken = [&](const std::string &candidate) {
    return std::ranges::any_of(existing, [&](const Branch &b) { return b.name == candidate; });
  };
  if (!taken(base))
    return base;
  for (std::size_t n = 1;; ++n) {
    auto candidate = base + " " + std::to_string(n);
    if (!taken(candidate))
      return candidate;
  }
}

std::size_t next_order(std::span<const Branch> existing) {
  if (existing.empty())
    return 0;
  return std::ranges::max(existing, {}, &Branch::order).order + 1;
}

} // namespace

Branch create_branch(const BranchCreateRequest &request, const Oid &tree, const Oid &head,
                     std::span<const Branch> existing, const Config &config,
                     std::uint64_t now_ms) {
  Branch b;
  b.id = BranchId::generate();
  b.name = dedup_name(request.name.value_or(config.default_branch_name), existing);
  b.applied = false;
  b.created_timestamp_ms = now_ms;
  b.updated_timestamp_ms = now_ms;
  b.tree = tree;
  b.head = head;
  b.ownership = request.ownership.value_or(Ownership{});
  b.order = request.order.value_or(next_order(existing));
  return b;
}

void apply_update(Branch &branch, const BranchUpdateRequest &request, const Config &config,
                  std::uint64_t now_ms) {
  if (request.id != branch.id) {
    throw Error(ErrorKind::invalid, "update for " + request.id.to_string() +
                                        " applied to branch " + branch.id.to_string());
  }

  if (request.upstream) {
    if (!is_valid_remote_name(config.remote_name)) {
      throw LoadError::invalid("upstream", ErrorKind::invalid,
                               "invalid remote name: '" + config.remote_name + "'");
    }
    if (!is_valid_branch_name(*request.upstream)) {
      throw LoadError::invalid("upstream", ErrorKind::invalid,
                               "invalid branch name: '" + *request.upstream + "'");
    }
  }

  Branch next = branch;
  if (request.name)
    next.name = *request.name;
  if (request.notes)
    next.notes = *request.notes;
  if (request.ownership)
    next.ownership = *request.ownership;
  if (request.order)
    next.order = *request.order;
  if (request.upstream)
    next.upstream = RemoteRefname{.remote = config.remote_name, .branch = *request.upstream};
  next.updated_timestamp_ms =
      std::max({now_ms, branch.updated_timestamp_ms, branch.created_timestamp_ms});

  branch = std::move(next);
}

} // namespace vbranch

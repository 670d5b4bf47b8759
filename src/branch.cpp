#include "vbranch/branch.hpp"

#include "vbranch/consts.hpp"

#include <utility>
#include <vector>

namespace vbranch {

namespace keys = consts::keys;

VirtualRefname Branch::refname() const {
  auto normalized = normalize_branch_name(name);
  if (normalized.empty()) {
    return VirtualRefname{.branch = id.to_string()};
  }
  return VirtualRefname{.branch = std::move(normalized)};
}

void Branch::store(Writer &writer, const Branch &branch) {
  auto put = [](std::string_view key, std::string value) {
    return WriteOp{.key = std::string(key), .value = Content::utf8(std::move(value))};
  };
  auto drop = [](std::string_view key) {
    return WriteOp{.key = std::string(key), .value = std::nullopt};
  };

  std::vector<WriteOp> batch{
      put(keys::kId, branch.id.to_string()),
      put(keys::kName, branch.name),
      put(keys::kNotes, branch.notes),
      put(keys::kApplied, std::string(branch.applied ? consts::kTrue : consts::kFalse)),
      put(keys::kOrder, std::to_string(branch.order)),
      put(keys::kTree, branch.tree.to_string()),
      put(keys::kHead, branch.head.to_string()),
      put(keys::kCreated, std::to_string(branch.created_timestamp_ms)),
      put(keys::kUpdated, std::to_string(branch.updated_timestamp_ms)),
      put(keys::kOwnership, branch.ownership.to_string()),
  };
  batch.push_back(branch.upstream ? put(keys::kUpstream, branch.upstream->to_string())
                                  : drop(keys::kUpstream));
  batch.push_back(branch.upstream_head
                      ? put(keys::kUpstreamHead, branch.upstream_head->to_string())
                      : drop(keys::kUpstreamHead));
  writer.apply(batch);
}

} // namespace vbranch

#pragma once
#include "vbranch/id.hpp"
#include "vbranch/oid.hpp"
#include "vbranch/ownership.hpp"
#include "vbranch/refname.hpp"
#include "vbranch/store.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace vbranch {

struct Branch;
using BranchId = Id<Branch>;

// A virtual branch record. It plays the role of a branch reference but lives
// only in the session store (.vbranch/branches/<id>/), never in the
// repository's refs.
struct Branch {
  BranchId id;
  std::string name;
  std::string notes;
  bool applied = false;
  std::optional<RemoteRefname> upstream;
  // last commit we pushed to the upstream branch
  std::optional<Oid> upstream_head;
  std::uint64_t created_timestamp_ms = 0;
  std::uint64_t updated_timestamp_ms = 0;
  /// last tree written to a session, or the merge base tree for a new branch;
  /// deltas are computed against it
  Oid tree;
  /// id of the last virtual commit on this branch
  Oid head;
  Ownership ownership;
  // position in which UIs list and apply branches
  std::size_t order = 0;

  [[nodiscard]] auto refname() const -> VirtualRefname;

  /**
   * Rebuild a branch from its stored keys.
   *  - id, meta/name, meta/tree, meta/head, both timestamps and
   *    meta/ownership must be present and well formed;
   *  - meta/notes ("") and meta/order (0) default when absent;
   *  - meta/applied falls back to false on any failure;
   *  - meta/upstream and meta/upstream_head are unset when absent or not
   *    text, and meta/upstream is unset when empty.
   * Throws LoadError naming the key, or StoreError from the reader.
   */
  static auto load(const Reader &reader) -> Branch;

  // Write every key in one batch; unset upstream fields are removed.
  static void store(Writer &writer, const Branch &branch);

  auto operator==(const Branch &) const -> bool = default;
};

} // namespace vbranch

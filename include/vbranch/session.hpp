#pragma once
#include "vbranch/branch.hpp"
#include "vbranch/config.hpp"
#include "vbranch/consts.hpp"
#include "vbranch/request.hpp"

#include <filesystem>
#include <vector>

namespace vbranch {

// Virtual branch records of one working directory, kept under
// <root>/.vbranch/branches/<id>/ with one file per key.
class Session {
public:
  explicit Session(std::filesystem::path root);

  // Core paths
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto state_dir() const -> std::filesystem::path { return root_ / consts::kStateDir; }
  [[nodiscard]] auto branches_dir() const -> std::filesystem::path {
    return state_dir() / consts::kBranchesDir;
  }
  [[nodiscard]] auto branch_dir(const BranchId &id) const -> std::filesystem::path {
    return branches_dir() / id.to_string();
  }

  // Create .vbranch/branches and write the config.
  // Fails if .vbranch already exists (to avoid clobber).
  void init(const Config &config = Config{}) const;
  [[nodiscard]] auto is_initialized() const -> bool;
  [[nodiscard]] auto config() const -> Config { return load_config(root_); }

  // Ids of all stored records, sorted. Directories that are not ids are skipped.
  [[nodiscard]] auto list_ids() const -> std::vector<BranchId>;
  // Throws LoadError (not_found on "id") when no record exists for `id`.
  [[nodiscard]] auto read(const BranchId &id) const -> Branch;
  // All branches ordered by `order`, then id.
  [[nodiscard]] auto read_all() const -> std::vector<Branch>;

  void write(const Branch &branch) const;
  // Delete the record; false if there was none.
  bool remove(const BranchId &id) const;

  // create_branch/apply_update against the stored branches, persisted.
  [[nodiscard]] auto create(const BranchCreateRequest &request, const Oid &tree,
                            const Oid &head) const -> Branch;
  auto update(const BranchUpdateRequest &request) const -> Branch;

private:
  std::filesystem::path root_;
};

} // namespace vbranch

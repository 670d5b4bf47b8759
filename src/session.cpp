#include "vbranch/session.hpp"

#include "vbranch/error.hpp"
#include "vbranch/fs.hpp"
#include "vbranch/store.hpp"
#include "vbranch/time.hpp"

#include <algorithm>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace stdfs = std::filesystem;

namespace vbranch {

Session::Session(stdfs::path root) : root_(std::move(root)) {}

auto Session::is_initialized() const -> bool { return fs::exists(state_dir()); }

void Session::init(const Config &config) const {
  if (is_initialized()) {
    throw StoreError("session already exists at: " + state_dir().string());
  }
  validate_config(config);
  std::error_code ec;
  stdfs::create_directories(branches_dir(), ec);
  if (ec) {
    throw StoreError("create branches dir failed: " + ec.message());
  }
  try {
    save_config(root_, config);
  } catch (const std::runtime_error &e) {
    throw StoreError(std::string("write config failed: ") + e.what());
  }
}

auto Session::list_ids() const -> std::vector<BranchId> {
  std::vector<std::string> names;
  try {
    names = fs::list_dirs(branches_dir());
  } catch (const std::runtime_error &e) {
    throw StoreError(e.what());
  }

  std::vector<BranchId> ids;
  for (const auto &name : names) {
    if (!is_canonical_uuid(name))
      continue; // stray directory
    auto id = BranchId::parse(name);
    if (id.to_string() != name)
      continue; // not written by us: record paths are lower case
    ids.push_back(id);
  }
  std::ranges::sort(ids);
  return ids;
}

auto Session::read(const BranchId &id) const -> Branch {
  const auto dir = branch_dir(id);
  if (!fs::exists(dir)) {
    throw LoadError::not_found("id");
  }
  Branch branch = Branch::load(DirectoryStore{dir});
  if (branch.id != id) {
    throw LoadError::invalid("id", ErrorKind::invalid,
                             "record " + id.to_string() + " holds id " + branch.id.to_string());
  }
  return branch;
}

auto Session::read_all() const -> std::vector<Branch> {
  std::vector<Branch> out;
  for (const auto &id : list_ids())
    out.push_back(read(id));
  std::ranges::sort(out, [](const Branch &a, const Branch &b) {
    return std::tie(a.order, a.id) < std::tie(b.order, b.id);
  });
  return out;
}

void Session::write(const Branch &branch) const {
  DirectoryStore store{branch_dir(branch.id)};
  Branch::store(store, branch);
}

bool Session::remove(const BranchId &id) const {
  std::error_code ec;
  const auto removed = stdfs::remove_all(branch_dir(id), ec);
  if (ec) {
    throw StoreError("remove " + id.to_string() + " failed: " + ec.message());
  }
  return removed > 0;
}

auto Session::create(const BranchCreateRequest &request, const Oid &tree, const Oid &head) const
    -> Branch {
  const auto existing = read_all();
  Branch branch = create_branch(request, tree, head, existing, config(), timeutil::now_ms());
  write(branch);
  return branch;
}

auto Session::update(const BranchUpdateRequest &request) const -> Branch {
  Branch branch = read(request.id);
  apply_update(branch, request, config(), timeutil::now_ms());
  write(branch);
  return branch;
}

} // namespace vbranch

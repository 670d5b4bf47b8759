#include "vbranch/error.hpp"
#include "vbranch/session.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static fs::path make_temp_dir() {
  auto base = fs::temp_directory_path();
  std::mt19937_64 rng{std::random_device{}()};
  auto dir = base / ("vbranch_session_" + std::to_string(rng()));
  fs::create_directories(dir);
  return dir;
}

int main() {
  const auto tmp = make_temp_dir();
  try {
    vbranch::Session session{tmp};
    if (session.is_initialized()) {
      std::cerr << "fresh directory reported as initialized\n";
      return 1;
    }
    session.init(vbranch::Config{.remote_name = "fork", .default_branch_name = "Lane"});
    if (!session.is_initialized() || !fs::is_directory(tmp / ".vbranch" / "branches")) {
      std::cerr << "init did not create .vbranch/branches\n";
      return 1;
    }
    try {
      session.init();
      std::cerr << "second init succeeded\n";
      return 1;
    } catch (const vbranch::StoreError &) {
      // expected
    }

    const auto tree = vbranch::sha1("tree");
    const auto head = vbranch::sha1("head");
    const auto first = session.create({}, tree, head);
    const auto second = session.create({.name = "feature"}, tree, head);
    const auto third = session.create({}, tree, head);
    if (first.name != "Lane" || third.name != "Lane 1" || second.order != 1 || third.order != 2) {
      std::cerr << "create did not see the stored branches: " << third.name << "\n";
      return 1;
    }
    if (!fs::exists(session.branch_dir(first.id) / "meta" / "name")) {
      std::cerr << "record files missing\n";
      return 1;
    }

    // directories that are not ids are ignored
    fs::create_directories(session.branches_dir() / "scratch");
    if (session.list_ids().size() != 3) {
      std::cerr << "expected 3 ids, got " << session.list_ids().size() << "\n";
      return 1;
    }

    if (session.read(second.id) != second) {
      std::cerr << "read does not match created branch\n";
      return 1;
    }

    // reorder and check read_all follows `order`
    const auto moved = session.update({.id = third.id, .order = 0, .upstream = "lane-1"});
    if (!moved.upstream || moved.upstream->to_string() != "refs/remotes/fork/lane-1") {
      std::cerr << "update did not qualify upstream with configured remote\n";
      return 1;
    }
    const auto all = session.read_all();
    if (all.size() != 3 || all[0].order != 0 || all[1].order != 0 || all[2].id != second.id) {
      std::cerr << "read_all order wrong\n";
      return 1;
    }
    if (session.read(third.id) != moved) {
      std::cerr << "update not persisted\n";
      return 1;
    }

    if (!session.remove(first.id) || session.remove(first.id)) {
      std::cerr << "remove result wrong\n";
      return 1;
    }
    try {
      (void)session.read(first.id);
      std::cerr << "read of removed branch succeeded\n";
      return 1;
    } catch (const vbranch::LoadError &e) {
      if (e.kind() != vbranch::ErrorKind::not_found || e.field() != "id") {
        std::cerr << "wrong error: " << e.what() << "\n";
        return 1;
      }
    }

    // remote names that could not be read back are refused up front
    {
      const auto other = tmp / "bad_remote";
      vbranch::Session bad{other};
      try {
        bad.init(vbranch::Config{.remote_name = "my fork", .default_branch_name = "Lane"});
        std::cerr << "init accepted remote 'my fork'\n";
        return 1;
      } catch (const vbranch::Error &e) {
        if (e.kind() != vbranch::ErrorKind::invalid || bad.is_initialized()) {
          std::cerr << "bad remote init: " << e.what() << "\n";
          return 1;
        }
      }
    }
    {
      std::ofstream ofs(session.state_dir() / "config", std::ios::trunc);
      ofs << "remote: my/fork\n";
    }
    try {
      (void)session.update({.id = second.id, .upstream = "feat"});
      std::cerr << "update used remote 'my/fork'\n";
      return 1;
    } catch (const vbranch::Error &e) {
      if (e.kind() != vbranch::ErrorKind::invalid) {
        std::cerr << "wrong error: " << e.what() << "\n";
        return 1;
      }
    }
    if (session.read(second.id) != second || session.read_all().size() != 2) {
      std::cerr << "rejected update changed the stored records\n";
      return 1;
    }

    std::cout << "session OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(tmp);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(tmp, ec);
  return 0;
}

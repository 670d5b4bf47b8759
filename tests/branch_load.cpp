#include "vbranch/branch.hpp"
#include "vbranch/consts.hpp"
#include "vbranch/error.hpp"
#include "vbranch/store.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <utility>

using vbranch::Branch;
using vbranch::Content;
using vbranch::ErrorKind;
using vbranch::LoadError;
using vbranch::MemoryStore;
namespace keys = vbranch::consts::keys;

static const std::string kTree = "4b825dc642cb6eb9a060e54bf8d69288fbee4904";
static const std::string kHead = "a9993e364706816aba3e25717850c26c9cd0d89d";
static const std::string kId = "0f8fad5b-d9cb-469f-a165-70867728950e";

// A record with only the mandatory keys.
static MemoryStore minimal_record() {
  MemoryStore s;
  s.set(std::string(keys::kId), Content::utf8(kId));
  s.set(std::string(keys::kName), Content::utf8("Virtual branch"));
  s.set(std::string(keys::kTree), Content::utf8(kTree));
  s.set(std::string(keys::kHead), Content::utf8(kHead));
  s.set(std::string(keys::kCreated), Content::utf8("1700000000000"));
  s.set(std::string(keys::kUpdated), Content::utf8("1700000000500"));
  s.set(std::string(keys::kOwnership), Content::utf8("src/a.cpp:1-4,9-12"));
  return s;
}

// Run load() and report the LoadError, if any.
static std::optional<LoadError> load_error(const vbranch::Reader &reader) {
  try {
    (void)Branch::load(reader);
    return std::nullopt;
  } catch (const LoadError &e) {
    return e;
  }
}

// Reader whose reads of one key fail at the storage level.
class FailingReader : public vbranch::Reader {
public:
  FailingReader(const MemoryStore &inner, std::string failing_key)
      : inner_(inner), failing_key_(std::move(failing_key)) {}

  std::optional<Content> read(std::string_view key) const override {
    if (key == failing_key_)
      throw vbranch::StoreError(std::string(key) + ": disk on fire");
    return inner_.read(key);
  }

private:
  const MemoryStore &inner_;
  std::string failing_key_;
};

static int check_invalid(const std::string &key, const Content &value, ErrorKind cause) {
  auto s = minimal_record();
  s.set(key, value);
  const auto err = load_error(s);
  if (!err || err->kind() != ErrorKind::invalid || err->field() != key || err->cause_kind() != cause) {
    std::cerr << "expected invalid(" << key << ", " << vbranch::to_string_view(cause) << "), got "
              << (err ? err->what() : "success") << "\n";
    return 1;
  }
  if (std::string(err->what()).rfind(key + ": ", 0) != 0) {
    std::cerr << "message does not start with the key: " << err->what() << "\n";
    return 1;
  }
  return 0;
}

int main() {
  // optional keys absent -> defaults
  {
    const auto b = Branch::load(minimal_record());
    if (b.id.to_string() != kId || b.name != "Virtual branch" || !b.notes.empty() || b.applied ||
        b.order != 0 || b.upstream || b.upstream_head || b.tree.to_string() != kTree ||
        b.head.to_string() != kHead || b.created_timestamp_ms != 1700000000000ULL ||
        b.updated_timestamp_ms != 1700000000500ULL || b.ownership.to_string() != "src/a.cpp:1-4,9-12") {
      std::cerr << "minimal record loaded wrong\n";
      return 1;
    }
  }

  // every mandatory key is a hard failure when missing
  for (const auto key : {keys::kId, keys::kName, keys::kTree, keys::kHead, keys::kCreated,
                         keys::kUpdated, keys::kOwnership}) {
    auto s = minimal_record();
    s.erase(std::string(key));
    const auto err = load_error(s);
    if (!err || err->kind() != ErrorKind::not_found || err->field() != key) {
      std::cerr << "missing " << key << " not reported as not_found\n";
      return 1;
    }
  }

  // malformed mandatory and optional values name their key and cause
  if (check_invalid(std::string(keys::kId), Content::utf8("not-a-uuid"), ErrorKind::malformed_identifier) ||
      check_invalid(std::string(keys::kTree), Content::utf8("not an oid"), ErrorKind::invalid) ||
      check_invalid(std::string(keys::kHead), Content::utf8(""), ErrorKind::invalid) ||
      check_invalid(std::string(keys::kName), Content::binary({0xFF}), ErrorKind::content_mismatch) ||
      check_invalid(std::string(keys::kCreated), Content::utf8("-5"), ErrorKind::content_mismatch) ||
      check_invalid(std::string(keys::kUpdated), Content::utf8("soon"), ErrorKind::content_mismatch) ||
      check_invalid(std::string(keys::kOwnership), Content::utf8("no colon here"),
                    ErrorKind::ownership_parse) ||
      check_invalid(std::string(keys::kNotes), Content::binary({0xFF, 0xFE}),
                    ErrorKind::content_mismatch) ||
      check_invalid(std::string(keys::kOrder), Content::utf8("first"), ErrorKind::content_mismatch) ||
      check_invalid(std::string(keys::kUpstreamHead), Content::utf8("zz"), ErrorKind::invalid) ||
      check_invalid(std::string(keys::kUpstream), Content::utf8("origin/main"), ErrorKind::invalid)) {
    return 1;
  }

  // present optional values are used
  {
    auto s = minimal_record();
    s.set(std::string(keys::kNotes), Content::utf8("wip: do not push"));
    s.set(std::string(keys::kOrder), Content::utf8("7"));
    s.set(std::string(keys::kApplied), Content::utf8("true"));
    s.set(std::string(keys::kUpstream), Content::utf8("refs/remotes/origin/feature"));
    s.set(std::string(keys::kUpstreamHead), Content::utf8(kHead));
    const auto b = Branch::load(s);
    if (b.notes != "wip: do not push" || b.order != 7 || !b.applied || !b.upstream ||
        b.upstream->remote != "origin" || b.upstream->branch != "feature" || !b.upstream_head ||
        b.upstream_head->to_string() != kHead) {
      std::cerr << "optional values not loaded\n";
      return 1;
    }
  }

  // applied degrades to false on anything unreadable
  for (const auto &value : {Content::utf8("maybe"), Content::utf8(""), Content::binary({1})}) {
    auto s = minimal_record();
    s.set(std::string(keys::kApplied), value);
    if (Branch::load(s).applied) {
      std::cerr << "unreadable meta/applied did not default to false\n";
      return 1;
    }
  }
  {
    const auto s = minimal_record();
    if (Branch::load(FailingReader{s, std::string(keys::kApplied)}).applied) {
      std::cerr << "failing meta/applied read did not default to false\n";
      return 1;
    }
  }

  // upstream tri-state: empty text and binary content are unset
  for (const auto &value : {Content::utf8(""), Content::binary({0xFF})}) {
    auto s = minimal_record();
    s.set(std::string(keys::kUpstream), value);
    s.set(std::string(keys::kUpstreamHead), value.is_utf8() ? Content::utf8(kHead) : value);
    const auto b = Branch::load(s);
    if (b.upstream) {
      std::cerr << "unset upstream loaded as " << b.upstream->to_string() << "\n";
      return 1;
    }
    if (!value.is_utf8() && b.upstream_head) {
      std::cerr << "binary upstream_head not treated as unset\n";
      return 1;
    }
  }

  // storage failures on other keys propagate as StoreError
  {
    const auto s = minimal_record();
    try {
      (void)Branch::load(FailingReader{s, std::string(keys::kName)});
      std::cerr << "store failure swallowed\n";
      return 1;
    } catch (const vbranch::StoreError &e) {
      if (e.kind() != ErrorKind::store) {
        std::cerr << "wrong kind\n";
        return 1;
      }
    }
  }

  std::cout << "branch_load OK\n";
  return 0;
}

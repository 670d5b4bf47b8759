#pragma once
#include "vbranch/oid.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vbranch {

/**
 * A contiguous, inclusive line range [start, end] of one file plus an
 * optional content fingerprint and the time it was last touched.
 * Text form: "start-end[-hash[-timestamp_ms]]".
 */
class Hunk {
public:
  // Throws InvalidRange if end < start.
  Hunk(std::uint32_t start, std::uint32_t end, std::optional<Oid> hash = std::nullopt,
       std::optional<std::uint64_t> timestamp_ms = std::nullopt);

  // Throws OwnershipParseError on malformed text.
  static auto parse(std::string_view text) -> Hunk;

  [[nodiscard]] std::uint32_t start() const { return start_; }
  [[nodiscard]] std::uint32_t end() const { return end_; }
  [[nodiscard]] const std::optional<Oid> &hash() const { return hash_; }
  [[nodiscard]] const std::optional<std::uint64_t> &timestamp_ms() const { return timestamp_ms_; }

  [[nodiscard]] auto overlaps(const Hunk &other) const -> bool {
    return start_ <= other.end_ && other.start_ <= end_;
  }
  [[nodiscard]] auto same_range(const Hunk &other) const -> bool {
    return start_ == other.start_ && end_ == other.end_;
  }

  [[nodiscard]] auto to_string() const -> std::string;

  auto operator==(const Hunk &) const -> bool = default;

private:
  std::uint32_t start_;
  std::uint32_t end_;
  std::optional<Oid> hash_;
  std::optional<std::uint64_t> timestamp_ms_;
};

/**
 * The hunks of one file claimed by a branch. Hunks are kept sorted by start
 * line and never overlap. Text form: "path:hunk,hunk,...".
 */
class FileOwnership {
public:
  FileOwnership() = default;
  // Throws OwnershipParseError if `path` is empty or contains a line break.
  explicit FileOwnership(std::string path);
  FileOwnership(std::string path, const std::vector<Hunk> &hunks);

  // Throws OwnershipParseError on malformed text or when no hunk is given.
  static auto parse(std::string_view text) -> FileOwnership;

  // Every existing hunk overlapping `hunk` is dropped, then `hunk` is inserted
  // at its sorted position. The latest claim always wins.
  void add(const Hunk &hunk);

  // Remove the hunk covering exactly the same range. Returns false if none did.
  bool remove(const Hunk &hunk);

  [[nodiscard]] auto contains(const Hunk &hunk) const -> bool;

  [[nodiscard]] const std::string &path() const { return path_; }
  [[nodiscard]] const std::vector<Hunk> &hunks() const { return hunks_; }
  [[nodiscard]] bool empty() const { return hunks_.empty(); }

  [[nodiscard]] auto to_string() const -> std::string;

  auto operator==(const FileOwnership &) const -> bool = default;

private:
  std::string path_;
  std::vector<Hunk> hunks_;
};

/**
 * Every file region a branch claims, keyed by path. One line of text per
 * file; the empty string is the empty ownership. Paths are kept verbatim,
 * surrounding whitespace included.
 */
class Ownership {
public:
  using FileMap = std::map<std::string, FileOwnership>;

  Ownership() = default;

  // Throws OwnershipParseError carrying the offending line.
  static auto parse(std::string_view text) -> Ownership;

  // Throws OwnershipParseError for a path the text form cannot carry.
  void add(const std::string &path, const Hunk &hunk);
  // Merge all hunks of `file` into this ownership.
  void put(const FileOwnership &file);
  // Remove one hunk; the file entry disappears with its last hunk.
  bool remove(const std::string &path, const Hunk &hunk);
  // Remove and return the file entry (empty FileOwnership for `path` if absent).
  FileOwnership take(const std::string &path);

  [[nodiscard]] auto contains(const std::string &path) const -> bool;
  [[nodiscard]] auto find(const std::string &path) const -> const FileOwnership *;
  [[nodiscard]] const FileMap &files() const { return files_; }
  [[nodiscard]] bool empty() const { return files_.empty(); }
  [[nodiscard]] std::size_t size() const { return files_.size(); }

  [[nodiscard]] auto to_string() const -> std::string;

  auto operator==(const Ownership &) const -> bool = default;

private:
  FileMap files_;
};

} // namespace vbranch

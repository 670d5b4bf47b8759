#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace vbranch::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

// Remove a file; returns false if it did not exist.
bool remove_file(const std::filesystem::path& p);

// Names of the immediate subdirectories of `dir` (empty if `dir` is missing).
std::vector<std::string> list_dirs(const std::filesystem::path& dir);

} // namespace vbranch::fs

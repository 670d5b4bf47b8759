#pragma once
#include "vbranch/consts.hpp"

#include <filesystem>
#include <string>

namespace vbranch {

struct Config {
  std::string remote_name{consts::kDefaultRemote};              // qualifies upstream short names
  std::string default_branch_name{consts::kDefaultBranchName};  // used when a create request has no name
};

// Throws Error(ErrorKind::invalid) unless remote_name is a single valid ref component
void validate_config(const Config& config);

// Read .vbranch/config (defaults for a missing file or missing keys).
// A remote name that could not qualify an upstream ref is rejected.
Config load_config(const std::filesystem::path& root);

// Overwrite .vbranch/config with the given settings (validated first)
void save_config(const std::filesystem::path& root, const Config& config);

} // namespace vbranch

#include "vbranch/config.hpp"

#include "vbranch/error.hpp"
#include "vbranch/fs.hpp"
#include "vbranch/refname.hpp"
#include "vbranch/util.hpp"

#include <sstream>
#include <string_view>

namespace vbranch {

namespace {

constexpr std::string_view k_remote = "remote:";
constexpr std::string_view k_default_name = "default_branch_name:";

std::filesystem::path cfg_path(const std::filesystem::path &root) {
  return root / consts::kStateDir / consts::kConfigFile;
}

} // namespace

void validate_config(const Config &config) {
  if (!is_valid_remote_name(config.remote_name)) {
    throw Error(ErrorKind::invalid, "config: invalid remote name: '" + config.remote_name + "'");
  }
}

auto load_config(const std::filesystem::path &root) -> Config {
  Config out{};
  const auto path = cfg_path(root);
  if (!fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.starts_with(k_remote)) {
      if (const auto value = strutil::trim(sv.substr(k_remote.size())); !value.empty())
        out.remote_name = value;
    } else if (sv.starts_with(k_default_name)) {
      if (const auto value = strutil::trim(sv.substr(k_default_name.size())); !value.empty())
        out.default_branch_name = value;
    }
  }
  validate_config(out);
  return out;
}

void save_config(const std::filesystem::path &root, const Config &config) {
  validate_config(config);
  std::ostringstream os;
  os << k_remote << ' ' << config.remote_name << '\n'
     << k_default_name << ' ' << config.default_branch_name << '\n';
  const std::string s = os.str();
  fs::write_file_atomic(cfg_path(root), strutil::as_bytes(s));
}

} // namespace vbranch

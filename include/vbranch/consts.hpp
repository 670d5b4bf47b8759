#pragma once
#include <cstddef>
#include <string_view>

namespace vbranch::consts {

// Directory and file names
inline constexpr std::string_view kStateDir    = ".vbranch";
inline constexpr std::string_view kBranchesDir = "branches";
inline constexpr std::string_view kConfigFile  = "config";

// Defaults
inline constexpr std::string_view kDefaultRemote     = "origin";
inline constexpr std::string_view kDefaultBranchName = "Virtual branch";

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)

// ——— Identifier text ———
inline constexpr std::size_t kIdTextLen = 36;  // 8-4-4-4-12

// ——— Reference prefixes ———
inline constexpr std::string_view kRemotesPrefix = "refs/remotes/";
inline constexpr std::string_view kVirtualPrefix = "refs/gitbutler/";

// ——— Branch record keys ———
namespace keys {
inline constexpr std::string_view kId           = "id";
inline constexpr std::string_view kName         = "meta/name";
inline constexpr std::string_view kNotes        = "meta/notes";
inline constexpr std::string_view kApplied      = "meta/applied";
inline constexpr std::string_view kOrder        = "meta/order";
inline constexpr std::string_view kUpstreamHead = "meta/upstream_head";
inline constexpr std::string_view kUpstream     = "meta/upstream";
inline constexpr std::string_view kTree         = "meta/tree";
inline constexpr std::string_view kHead         = "meta/head";
inline constexpr std::string_view kCreated      = "meta/created_timestamp_ms";
inline constexpr std::string_view kUpdated      = "meta/updated_timestamp_ms";
inline constexpr std::string_view kOwnership    = "meta/ownership";
} // namespace keys

// ——— Ownership text ———
inline constexpr char kPathSep  = ':';
inline constexpr char kHunkSep  = ',';
inline constexpr char kFieldSep = '-';
inline constexpr char kLF       = '\n';

// ——— Stored booleans ———
inline constexpr std::string_view kTrue  = "true";
inline constexpr std::string_view kFalse = "false";

} // namespace vbranch::consts

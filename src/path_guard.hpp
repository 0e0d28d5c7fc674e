#pragma once

#include "shared_roots.hpp"
#include <optional>
#include <string>

namespace lx {

enum class Access {
    Allowed,
    Forbidden,   // outside every permitted root
    NotFound     // inside a root but not an existing regular file
};

struct Resolution {
    Access access = Access::NotFound;
    std::string path;   // normalized absolute path, set when Allowed
};

// Lexical normalization: folds "." and "..", collapses separators and drops
// any trailing separator. Does not touch the filesystem.
std::string normalize_path(const std::string& path);

// Maps a decoded request path (and optional ?path= override) to a normalized
// filesystem path without checking access.
std::string resolve_target(const std::string& token,
                           const std::optional<std::string>& query_path,
                           const std::string& shared_dir);

// Textual prefix containment against the shared and home roots. Symlinks are
// not resolved, so a link inside a root that points outside it is accepted.
bool is_within_roots(const std::string& path, const RootSnapshot& roots);

Resolution resolve_request_path(const std::string& token,
                                const std::optional<std::string>& query_path,
                                const RootSnapshot& roots);

} // namespace lx

#include "path_guard.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace lx {

std::string normalize_path(const std::string& path) {
    if (path.empty()) return ".";

    std::string out = fs::path(path).lexically_normal().string();
    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out.empty() ? "." : out;
}

static bool has_drive_letter(const std::string& token) {
    return token.size() >= 2
        && std::isalpha(static_cast<unsigned char>(token[0]))
        && token[1] == ':';
}

std::string resolve_target(const std::string& token,
                           const std::optional<std::string>& query_path,
                           const std::string& shared_dir) {
    if (query_path) {
        return normalize_path(*query_path);
    }

    // The request target always starts with '/'; what follows it is the token
    std::string fp = token;
    if (!fp.empty() && fp.front() == '/') {
        fp.erase(0, 1);
    }

    if (has_drive_letter(fp) || fs::path(fp).is_absolute()) {
        return normalize_path(fp);
    }
    return normalize_path((fs::path(shared_dir) / fp).string());
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool is_within_roots(const std::string& path, const RootSnapshot& roots) {
    for (const std::string* root : {&roots.shared_dir, &roots.home_dir}) {
        if (root->empty()) continue;
        if (starts_with(path, normalize_path(*root))) {
            return true;
        }
    }
    return false;
}

Resolution resolve_request_path(const std::string& token,
                                const std::optional<std::string>& query_path,
                                const RootSnapshot& roots) {
    Resolution result;
    std::string candidate = resolve_target(token, query_path, roots.shared_dir);

    if (!is_within_roots(candidate, roots)) {
        spdlog::warn("Access denied outside permitted roots: {}", candidate);
        result.access = Access::Forbidden;
        return result;
    }

    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec)) {
        result.access = Access::NotFound;
        return result;
    }

    result.access = Access::Allowed;
    result.path = std::move(candidate);
    return result;
}

} // namespace lx

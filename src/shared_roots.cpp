#include "shared_roots.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

namespace lx {

SharedRoots::SharedRoots(const std::string& shared_dir, const std::string& home_dir)
    : shared_dir_(shared_dir)
    , home_dir_(home_dir)
{
}

RootSnapshot SharedRoots::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return RootSnapshot{shared_dir_, home_dir_};
}

bool SharedRoots::set_shared_dir(const std::string& dir) {
    std::error_code ec;
    if (dir.empty() || !fs::is_directory(dir, ec)) {
        return false;
    }

    std::string resolved = fs::absolute(dir, ec).lexically_normal().string();
    if (ec) return false;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        shared_dir_ = resolved;
    }
    spdlog::info("Shared directory set to {}", resolved);
    return true;
}

std::string SharedRoots::shared_dir() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return shared_dir_;
}

} // namespace lx

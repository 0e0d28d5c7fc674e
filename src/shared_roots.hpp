#pragma once

#include <shared_mutex>
#include <string>

namespace lx {

// Consistent view of the permitted roots for the duration of one request
struct RootSnapshot {
    std::string shared_dir;
    std::string home_dir;
};

// Synchronized holder for the shared directory. Administrative reassignment
// affects requests that snapshot after it, never ones already in flight.
class SharedRoots {
public:
    SharedRoots(const std::string& shared_dir, const std::string& home_dir);

    // Non-copyable
    SharedRoots(const SharedRoots&) = delete;
    SharedRoots& operator=(const SharedRoots&) = delete;

    RootSnapshot snapshot() const;

    // Fails if `dir` is not an existing directory; stores it absolute.
    bool set_shared_dir(const std::string& dir);

    std::string shared_dir() const;
    const std::string& home_dir() const { return home_dir_; }

private:
    mutable std::shared_mutex mutex_;
    std::string shared_dir_;
    const std::string home_dir_;
};

} // namespace lx

#include "transfer/cleanup_manager.hpp"

#include "storage/path_resolver.hpp"

#include <spdlog/spdlog.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <iterator>

namespace MediaShuttle::Transfer
{

namespace
{

std::ptrdiff_t Depth(const fs::path& path) { return std::distance(path.begin(), path.end()); }

// "a/b/" and "a/b/." both become "a/b"
fs::path Clean(const fs::path& path)
{
    auto clean = path.lexically_normal();
    if (!clean.has_filename() && clean.has_parent_path() && clean != clean.root_path()) {
        clean = clean.parent_path();
    }
    return clean;
}

}  // namespace

std::size_t CleanupManager::RemoveEmptyDirectories(
    std::vector<fs::path> directories, const fs::path& root
)
{
    for (auto& dir : directories) {
        dir = Clean(dir);
    }
    std::ranges::sort(directories);
    const auto [first, last] = std::ranges::unique(directories);
    directories.erase(first, last);

    std::ranges::stable_sort(directories, [](const fs::path& a, const fs::path& b) {
        return Depth(a) > Depth(b);
    });

    const auto clean_root = Clean(root);
    std::size_t removed   = 0;
    for (const auto& dir : directories) {
        if (dir == clean_root || !Storage::PathResolver::IsWithin(clean_root, dir)) {
            continue;
        }
        if (::rmdir(dir.c_str()) == 0) {
            ++removed;
            spdlog::debug("Removed empty source directory {}", dir.string());
        } else {
            spdlog::trace("Kept source directory {} (errno {})", dir.string(), errno);
        }
    }
    return removed;
}

}  // namespace MediaShuttle::Transfer

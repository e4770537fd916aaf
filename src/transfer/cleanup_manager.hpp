#ifndef MEDIASHUTTLE_SRC_TRANSFER_CLEANUP_MANAGER_HPP_
#define MEDIASHUTTLE_SRC_TRANSFER_CLEANUP_MANAGER_HPP_

#include <cstddef>
#include <filesystem>
#include <vector>

namespace MediaShuttle::Transfer
{

namespace fs = std::filesystem;

class CleanupManager
{
    public:
    CleanupManager()                                 = delete;
    CleanupManager(const CleanupManager&)            = delete;
    CleanupManager& operator=(const CleanupManager&) = delete;
    ~CleanupManager()                                = delete;

    // Deduplicates `directories`, orders them deepest first and rmdir(2)s each
    // one. Only empty directories go away; every failure is ignored. `root`
    // itself and anything outside it are never touched. Returns the number of
    // directories removed.
    static std::size_t RemoveEmptyDirectories(
        std::vector<fs::path> directories, const fs::path& root
    );
};

}  // namespace MediaShuttle::Transfer

#endif  // MEDIASHUTTLE_SRC_TRANSFER_CLEANUP_MANAGER_HPP_

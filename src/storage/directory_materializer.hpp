#ifndef MEDIASHUTTLE_SRC_STORAGE_DIRECTORY_MATERIALIZER_HPP_
#define MEDIASHUTTLE_SRC_STORAGE_DIRECTORY_MATERIALIZER_HPP_

#include "cancellation_token.hpp"
#include "storage/i_permission_normalizer.hpp"
#include "storage/storage_error.hpp"

#include <filesystem>

namespace MediaShuttle::Storage
{

namespace fs = std::filesystem;

// Creates directory chains one level at a time so the permission normalizer
// sees every created (or already present) segment. create_directories() would
// leave intermediate levels with umask-derived modes.
class DirectoryMaterializer
{
    public:
    explicit DirectoryMaterializer(IPermissionNormalizer& normalizer);

    DirectoryMaterializer(const DirectoryMaterializer&)            = delete;
    DirectoryMaterializer& operator=(const DirectoryMaterializer&) = delete;

    // Ensures `target_dir` exists. Segments between `base_root` (exclusive) and
    // `target_dir` (inclusive) are created and normalized individually. A target
    // outside `base_root` is created as a single leaf; the root itself is left
    // untouched.
    StorageResult<void> EnsureDirectory(
        const fs::path& target_dir, const fs::path& base_root, const CancellationToken* cancel = nullptr
    );

    private:
    StorageResult<void> CreateLevel(const fs::path& dir);

    IPermissionNormalizer& normalizer_;
};

}  // namespace MediaShuttle::Storage

#endif  // MEDIASHUTTLE_SRC_STORAGE_DIRECTORY_MATERIALIZER_HPP_

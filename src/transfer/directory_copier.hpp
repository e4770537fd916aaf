#ifndef MEDIASHUTTLE_SRC_TRANSFER_DIRECTORY_COPIER_HPP_
#define MEDIASHUTTLE_SRC_TRANSFER_DIRECTORY_COPIER_HPP_

#include "cancellation_token.hpp"
#include "storage/directory_materializer.hpp"
#include "storage/i_permission_normalizer.hpp"
#include "storage/storage_error.hpp"
#include "transfer/file_copier.hpp"
#include "transfer/transfer_types.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace MediaShuttle::Transfer
{

namespace fs = std::filesystem;

struct FileInfo {
    fs::path relative_path;
    fs::path absolute_path;
    std::uint64_t size = 0;
};

struct DirectoryListing {
    std::vector<FileInfo> files;             ///< Regular files, sorted by relative path
    std::vector<fs::path> directories;       ///< Sub-directories (relative), parents first
    std::uint64_t total_bytes = 0;
};

// Walks `root` with an explicit stack. Entries that are neither regular files
// nor directories (symlinks, sockets, devices) are skipped.
Storage::StorageResult<DirectoryListing> EnumerateTree(
    const fs::path& root, const CancellationToken* cancel = nullptr
);

class DirectoryCopier
{
    private:
    template <typename T>
    using StorageResult = Storage::StorageResult<T>;

    public:
    DirectoryCopier(
        const FileCopier& file_copier, Storage::DirectoryMaterializer& materializer,
        Storage::IPermissionNormalizer& normalizer
    );

    DirectoryCopier(const DirectoryCopier&)            = delete;
    DirectoryCopier& operator=(const DirectoryCopier&) = delete;

    // Copies the tree below `src_dir` into `dst_dir`, one file at a time.
    // Progress is reported across the whole tree; an empty tree reports (0, 0).
    StorageResult<std::uint64_t> CopyDirectory(
        const fs::path& src_dir, const fs::path& dst_dir, const fs::path& base_root,
        const ByteProgressCallback& on_progress, const CancellationToken* cancel = nullptr
    );

    private:
    const FileCopier& file_copier_;
    Storage::DirectoryMaterializer& materializer_;
    Storage::IPermissionNormalizer& normalizer_;
};

}  // namespace MediaShuttle::Transfer

#endif  // MEDIASHUTTLE_SRC_TRANSFER_DIRECTORY_COPIER_HPP_

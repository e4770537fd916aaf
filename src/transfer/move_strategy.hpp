#ifndef MEDIASHUTTLE_SRC_TRANSFER_MOVE_STRATEGY_HPP_
#define MEDIASHUTTLE_SRC_TRANSFER_MOVE_STRATEGY_HPP_

#include "cancellation_token.hpp"
#include "storage/i_permission_normalizer.hpp"
#include "storage/storage_error.hpp"
#include "transfer/directory_copier.hpp"
#include "transfer/file_copier.hpp"
#include "transfer/transfer_types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <system_error>

namespace MediaShuttle::Transfer
{

namespace fs = std::filesystem;

// Test seams for the move path. Unset members fall back to the real syscalls.
struct MoveHooks {
    std::function<std::error_code(const fs::path &, const fs::path &)> rename;
};

struct MoveOutcome {
    bool renamed = false;          ///< True when the in-place rename succeeded
    std::error_code rename_error;  ///< Why the rename was not used (fallback only)
    std::uint64_t bytes_copied = 0;
};

class MoveStrategy
{
    private:
    template <typename T>
    using StorageResult = Storage::StorageResult<T>;

    public:
    MoveStrategy(
        const FileCopier &file_copier, DirectoryCopier &directory_copier,
        Storage::IPermissionNormalizer &normalizer, MoveHooks hooks = {}
    );

    MoveStrategy(const MoveStrategy &)            = delete;
    MoveStrategy &operator=(const MoveStrategy &) = delete;

    // Moves `src` to `dst`. Tries rename(2) first; on any rename failure the
    // entry is copied (with progress) and the source is removed only after the
    // copy fully succeeded. With `overwrite`, an existing `dst` is removed first.
    // `base_root` bounds directory materialization for the fallback copy.
    StorageResult<MoveOutcome> Move(
        const fs::path &src, const fs::path &dst, const fs::path &base_root, bool is_directory,
        bool overwrite, const ByteProgressCallback &on_progress,
        const CancellationToken *cancel = nullptr
    );

    private:
    std::error_code Rename(const fs::path &from, const fs::path &to) const;
    StorageResult<void> RemoveSource(const fs::path &src, bool is_directory) const;

    const FileCopier &file_copier_;
    DirectoryCopier &directory_copier_;
    Storage::IPermissionNormalizer &normalizer_;
    MoveHooks hooks_;
};

}  // namespace MediaShuttle::Transfer

#endif  // MEDIASHUTTLE_SRC_TRANSFER_MOVE_STRATEGY_HPP_

#include "transfer/move_strategy.hpp"

#include "storage/path_resolver.hpp"

#include <spdlog/spdlog.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <utility>

namespace MediaShuttle::Transfer
{

using Storage::ErrnoError;
using Storage::MapFilesystemError;

MoveStrategy::MoveStrategy(
    const FileCopier &file_copier, DirectoryCopier &directory_copier,
    Storage::IPermissionNormalizer &normalizer, MoveHooks hooks
)
    : file_copier_(file_copier),
      directory_copier_(directory_copier),
      normalizer_(normalizer),
      hooks_(std::move(hooks))
{
}

std::error_code MoveStrategy::Rename(const fs::path &from, const fs::path &to) const
{
    if (hooks_.rename) {
        return hooks_.rename(from, to);
    }
    if (std::rename(from.c_str(), to.c_str()) == -1) {
        return {errno, std::generic_category()};
    }
    return {};
}

Storage::StorageResult<void> MoveStrategy::RemoveSource(const fs::path &src, bool is_directory) const
{
    if (is_directory) {
        std::error_code ec;
        fs::remove_all(src, ec);
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }
        return {};
    }
    if (::unlink(src.c_str()) == -1) {
        return std::unexpected(ErrnoError(errno));
    }
    return {};
}

Storage::StorageResult<MoveOutcome> MoveStrategy::Move(
    const fs::path &src, const fs::path &dst, const fs::path &base_root, bool is_directory,
    bool overwrite, const ByteProgressCallback &on_progress, const CancellationToken *cancel
)
{
    if (Storage::PathResolver::IsWithin(dst, src) ||
        (is_directory && Storage::PathResolver::IsWithin(src, dst))) {
        spdlog::warn("Refusing to move {} onto overlapping path {}", src.string(), dst.string());
        return std::unexpected(Storage::make_error_code(Storage::StorageErrc::InvalidPath));
    }

    std::error_code ec;
    const bool dst_exists = fs::exists(fs::symlink_status(dst, ec));
    if (dst_exists && !overwrite) {
        return std::unexpected(Storage::make_error_code(Storage::StorageErrc::AlreadyExists));
    }
    if (dst_exists) {
        fs::remove_all(dst, ec);
        if (ec) {
            spdlog::warn("Could not remove existing {} before move: {}", dst.string(), ec.message());
            return std::unexpected(MapFilesystemError(ec));
        }
    }

    MoveOutcome outcome;
    const auto rename_ec = Rename(src, dst);
    if (!rename_ec) {
        auto mode_res = is_directory ? normalizer_.ApplyDirMode(dst) : normalizer_.ApplyFileMode(dst);
        if (!mode_res) {
            return std::unexpected(mode_res.error());
        }
        outcome.renamed = true;
        spdlog::debug("Renamed {} -> {}", src.string(), dst.string());
        return outcome;
    }

    // Any rename failure takes the fallback path. The original reason travels
    // in the outcome for the caller to report.
    outcome.rename_error = rename_ec;
    spdlog::warn(
        "rename({}, {}) failed ({}: {}), falling back to copy and delete", src.string(),
        dst.string(), rename_ec.value(), rename_ec.message()
    );

    Storage::StorageResult<std::uint64_t> copy_res =
        is_directory ? directory_copier_.CopyDirectory(src, dst, base_root, on_progress, cancel)
                     : file_copier_.CopyFile(src, dst, on_progress, cancel);
    if (!copy_res) {
        // The source is still intact; drop whatever part of the copy exists
        std::error_code cleanup_ec;
        fs::remove_all(dst, cleanup_ec);
        if (cleanup_ec) {
            spdlog::warn("Could not remove partial copy {}: {}", dst.string(), cleanup_ec.message());
        }
        return std::unexpected(copy_res.error());
    }
    outcome.bytes_copied = *copy_res;

    if (!is_directory) {
        auto mode_res = normalizer_.ApplyFileMode(dst);
        if (!mode_res) {
            return std::unexpected(mode_res.error());
        }
    }

    auto remove_res = RemoveSource(src, is_directory);
    if (!remove_res) {
        spdlog::error(
            "Copied {} to {} but could not remove the source: {}", src.string(), dst.string(),
            remove_res.error().message()
        );
        return std::unexpected(remove_res.error());
    }

    spdlog::debug("Moved {} -> {} via copy ({} bytes)", src.string(), dst.string(), outcome.bytes_copied);
    return outcome;
}

}  // namespace MediaShuttle::Transfer

#include "transfer/directory_copier.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>
#include <system_error>

namespace MediaShuttle::Transfer
{

using Storage::make_error_code;
using Storage::MapFilesystemError;
using Storage::StorageErrc;

Storage::StorageResult<DirectoryListing> EnumerateTree(
    const fs::path& root, const CancellationToken* cancel
)
{
    DirectoryListing listing;
    std::vector<fs::path> pending{fs::path{}};

    while (!pending.empty()) {
        if (cancel && cancel->IsCancelled()) {
            return std::unexpected(make_error_code(StorageErrc::Cancelled));
        }

        const fs::path rel_dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(root / rel_dir, ec);
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }

        for (; it != fs::directory_iterator{}; it.increment(ec)) {
            if (ec) {
                break;
            }
            const auto& entry   = *it;
            const auto rel_path = rel_dir / entry.path().filename();

            std::error_code status_ec;
            const auto status = entry.symlink_status(status_ec);
            if (status_ec) {
                return std::unexpected(MapFilesystemError(status_ec));
            }

            if (fs::is_directory(status)) {
                listing.directories.push_back(rel_path);
                pending.push_back(rel_path);
            } else if (fs::is_regular_file(status)) {
                std::error_code size_ec;
                const auto size = entry.file_size(size_ec);
                if (size_ec) {
                    return std::unexpected(MapFilesystemError(size_ec));
                }
                listing.files.push_back(FileInfo{rel_path, entry.path(), size});
                listing.total_bytes += size;
            } else {
                spdlog::warn("Skipping non-regular entry {}", entry.path().string());
            }
        }
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }
    }

    std::ranges::sort(listing.files, {}, &FileInfo::relative_path);
    std::ranges::sort(listing.directories);
    return listing;
}

DirectoryCopier::DirectoryCopier(
    const FileCopier& file_copier, Storage::DirectoryMaterializer& materializer,
    Storage::IPermissionNormalizer& normalizer
)
    : file_copier_(file_copier), materializer_(materializer), normalizer_(normalizer)
{
}

Storage::StorageResult<std::uint64_t> DirectoryCopier::CopyDirectory(
    const fs::path& src_dir, const fs::path& dst_dir, const fs::path& base_root,
    const ByteProgressCallback& on_progress, const CancellationToken* cancel
)
{
    auto listing = EnumerateTree(src_dir, cancel);
    if (!listing) {
        return std::unexpected(listing.error());
    }
    spdlog::debug(
        "Copying tree {} ({} files, {} dirs, {} bytes) -> {}", src_dir.string(),
        listing->files.size(), listing->directories.size(), listing->total_bytes, dst_dir.string()
    );

    auto root_res = materializer_.EnsureDirectory(dst_dir, base_root, cancel);
    if (!root_res) {
        return std::unexpected(root_res.error());
    }

    std::set<fs::path> materialized{dst_dir};
    auto ensure_dir = [&](const fs::path& dir) -> Storage::StorageResult<void> {
        if (materialized.contains(dir)) {
            return {};
        }
        auto res = materializer_.EnsureDirectory(dir, base_root, cancel);
        if (res) {
            materialized.insert(dir);
        }
        return res;
    };

    std::uint64_t tree_total = listing->total_bytes;
    std::uint64_t tree_done  = 0;

    if (listing->files.empty() && on_progress) {
        on_progress(0, 0);
    }

    for (const auto& file : listing->files) {
        const auto dst_file = dst_dir / file.relative_path;

        auto parent_res = ensure_dir(dst_file.parent_path());
        if (!parent_res) {
            return std::unexpected(parent_res.error());
        }

        const std::uint64_t file_base = tree_done;
        auto copy_res                 = file_copier_.CopyFile(
            file.absolute_path, dst_file,
            [&](std::uint64_t copied, std::uint64_t) {
                tree_total = std::max(tree_total, file_base + copied);
                if (on_progress) {
                    on_progress(file_base + copied, tree_total);
                }
            },
            cancel
        );
        if (!copy_res) {
            spdlog::debug("Tree copy failed at {}: {}", file.absolute_path.string(), copy_res.error().message());
            return std::unexpected(copy_res.error());
        }
        tree_done += *copy_res;

        auto mode_res = normalizer_.ApplyFileMode(dst_file);
        if (!mode_res) {
            return std::unexpected(mode_res.error());
        }
    }

    // Directories without files still have to exist on the other side
    for (const auto& rel_dir : listing->directories) {
        auto dir_res = ensure_dir(dst_dir / rel_dir);
        if (!dir_res) {
            return std::unexpected(dir_res.error());
        }
    }

    if (tree_done != tree_total && on_progress) {
        on_progress(tree_done, tree_done);
    }
    return tree_done;
}

}  // namespace MediaShuttle::Transfer

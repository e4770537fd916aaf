#include "storage/directory_materializer.hpp"

#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <cerrno>

namespace MediaShuttle::Storage
{

DirectoryMaterializer::DirectoryMaterializer(IPermissionNormalizer& normalizer)
    : normalizer_(normalizer)
{
}

StorageResult<void> DirectoryMaterializer::CreateLevel(const fs::path& dir)
{
    if (::mkdir(dir.c_str(), 0777) == -1) {
        const int mkdir_errno = errno;
        if (mkdir_errno != EEXIST) {
            spdlog::debug("mkdir({}) failed: {}", dir.string(), mkdir_errno);
            return std::unexpected(ErrnoError(mkdir_errno));
        }
        struct stat st{};
        if (::stat(dir.c_str(), &st) == -1) {
            return std::unexpected(ErrnoError(errno));
        }
        if (!S_ISDIR(st.st_mode)) {
            return std::unexpected(make_error_code(StorageErrc::NotADirectory));
        }
    } else {
        spdlog::trace("Created directory {}", dir.string());
    }

    // Re-applied to existing levels as well so repeated runs converge
    return normalizer_.ApplyDirMode(dir);
}

StorageResult<void> DirectoryMaterializer::EnsureDirectory(
    const fs::path& target_dir, const fs::path& base_root, const CancellationToken* cancel
)
{
    const auto target = target_dir.lexically_normal();
    const auto root   = base_root.lexically_normal();
    const auto rel    = target.lexically_relative(root);

    if (rel.empty() || *rel.begin() == "..") {
        if (cancel && cancel->IsCancelled()) {
            return std::unexpected(make_error_code(StorageErrc::Cancelled));
        }
        return CreateLevel(target);
    }
    if (rel == ".") {
        return {};
    }

    fs::path current = root;
    for (const auto& segment : rel) {
        if (segment.empty() || segment == ".") {
            continue;
        }
        if (cancel && cancel->IsCancelled()) {
            return std::unexpected(make_error_code(StorageErrc::Cancelled));
        }
        current /= segment;
        auto level_res = CreateLevel(current);
        if (!level_res) {
            spdlog::warn(
                "Failed to materialize '{}' (level '{}'): {}", target.string(), current.string(),
                level_res.error().message()
            );
            return level_res;
        }
    }
    return {};
}

}  // namespace MediaShuttle::Storage

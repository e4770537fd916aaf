#include "storage/permission_normalizer.hpp"

#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>

namespace MediaShuttle::Storage
{

PermissionNormalizer::PermissionNormalizer(const Config::PermissionSettings& settings)
    : settings_(settings)
{
}

StorageResult<void> PermissionNormalizer::ApplyDirMode(const std::filesystem::path& path)
{
    return Apply(path, settings_.dir_mode);
}

StorageResult<void> PermissionNormalizer::ApplyFileMode(const std::filesystem::path& path)
{
    return Apply(path, settings_.file_mode);
}

StorageResult<void> PermissionNormalizer::Apply(const std::filesystem::path& path, mode_t mode)
{
    if (!settings_.enabled) {
        return {};
    }

    if (settings_.uid.has_value() || settings_.gid.has_value()) {
        // -1 leaves the respective id unchanged
        const uid_t uid = settings_.uid.value_or(static_cast<uid_t>(-1));
        const gid_t gid = settings_.gid.value_or(static_cast<gid_t>(-1));
        if (::chown(path.c_str(), uid, gid) == -1) {
            const int chown_errno = errno;
            // An unprivileged service cannot hand files to another owner; the
            // mode is still applied.
            if (chown_errno != EPERM) {
                spdlog::warn("chown({}, {}, {}) failed: {}", path.string(), uid, gid, chown_errno);
                return std::unexpected(ErrnoError(chown_errno));
            }
            spdlog::debug("chown({}, {}, {}) not permitted, keeping owner", path.string(), uid, gid);
        }
    }

    // chmod after chown: chown may clear setuid/setgid bits
    if (::chmod(path.c_str(), mode) == -1) {
        const int chmod_errno = errno;
        spdlog::warn("chmod({}, {:o}) failed: {}", path.string(), mode, chmod_errno);
        return std::unexpected(ErrnoError(chmod_errno));
    }

    spdlog::trace("Normalized permissions of {} to {:o}", path.string(), mode);
    return {};
}

}  // namespace MediaShuttle::Storage

#ifndef MEDIASHUTTLE_SRC_STORAGE_I_PERMISSION_NORMALIZER_HPP_
#define MEDIASHUTTLE_SRC_STORAGE_I_PERMISSION_NORMALIZER_HPP_

#include "storage/storage_error.hpp"

#include <filesystem>

namespace MediaShuttle::Storage
{

// Applies the configured ownership and mode to freshly written entries.
// Both calls must be idempotent.
class IPermissionNormalizer
{
    public:
    virtual ~IPermissionNormalizer() = default;

    virtual StorageResult<void> ApplyDirMode(const std::filesystem::path& path)  = 0;
    virtual StorageResult<void> ApplyFileMode(const std::filesystem::path& path) = 0;
};

}  // namespace MediaShuttle::Storage

#endif  // MEDIASHUTTLE_SRC_STORAGE_I_PERMISSION_NORMALIZER_HPP_

#ifndef MEDIASHUTTLE_SRC_STORAGE_PERMISSION_NORMALIZER_HPP_
#define MEDIASHUTTLE_SRC_STORAGE_PERMISSION_NORMALIZER_HPP_

#include "config/config_types.hpp"
#include "storage/i_permission_normalizer.hpp"

#include <sys/types.h>
#include <filesystem>

namespace MediaShuttle::Storage
{

class PermissionNormalizer : public IPermissionNormalizer
{
    public:
    explicit PermissionNormalizer(const Config::PermissionSettings& settings);
    ~PermissionNormalizer() override = default;

    PermissionNormalizer(const PermissionNormalizer&)            = delete;
    PermissionNormalizer& operator=(const PermissionNormalizer&) = delete;

    StorageResult<void> ApplyDirMode(const std::filesystem::path& path) override;
    StorageResult<void> ApplyFileMode(const std::filesystem::path& path) override;

    private:
    StorageResult<void> Apply(const std::filesystem::path& path, mode_t mode);

    const Config::PermissionSettings settings_;
};

}  // namespace MediaShuttle::Storage

#endif  // MEDIASHUTTLE_SRC_STORAGE_PERMISSION_NORMALIZER_HPP_

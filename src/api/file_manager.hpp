#ifndef MEDIASHUTTLE_SRC_API_FILE_MANAGER_HPP_
#define MEDIASHUTTLE_SRC_API_FILE_MANAGER_HPP_

#include "config/config_types.hpp"
#include "storage/directory_materializer.hpp"
#include "storage/i_permission_normalizer.hpp"
#include "storage/path_resolver.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace MediaShuttle::Api
{

struct ApiResponse {
    unsigned status = 200;
    nlohmann::json body;

    static ApiResponse Ok(nlohmann::json body);
    static ApiResponse Fail(unsigned status, std::string error);
};

// Small file-management operations on the two panes. Every path is validated
// with a PathResolver before anything is touched.
class FileManager
{
    public:
    FileManager(const Config::ServiceConfig &config, Storage::IPermissionNormalizer &normalizer);

    FileManager(const FileManager &)            = delete;
    FileManager &operator=(const FileManager &) = delete;

    // {sourcePaths, destinationPath} -> names of sources already present in the
    // destination folder of the media pane.
    ApiResponse CheckExists(const nlohmann::json &body);

    // {files: [{sourcePath, destinationPath}]} -> the items whose destination
    // already exists in the media pane. Destinations that fail validation are
    // skipped; the transfer itself reports them.
    ApiResponse CheckDestinations(const nlohmann::json &body);

    // {pane, path} (query parameters) -> sorted listing of one directory:
    // directories first, then case-insensitive by name.
    ApiResponse List(const nlohmann::json &query);

    // {path, name} -> creates media/<path>/<name>.
    ApiResponse CreateFolder(const nlohmann::json &body);

    // {pane, paths} -> removes every path recursively. All paths are validated
    // before the first removal.
    ApiResponse Delete(const nlohmann::json &body);

    static bool IsValidFolderName(const std::string &name);

    private:
    std::optional<Storage::PathResolver> OpenPane(Config::Pane pane, ApiResponse &failure) const;

    const Config::ServiceConfig config_;
    Storage::DirectoryMaterializer materializer_;
};

}  // namespace MediaShuttle::Api

#endif  // MEDIASHUTTLE_SRC_API_FILE_MANAGER_HPP_

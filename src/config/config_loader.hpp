#ifndef MEDIASHUTTLE_SRC_CONFIG_CONFIG_LOADER_HPP_
#define MEDIASHUTTLE_SRC_CONFIG_CONFIG_LOADER_HPP_

#include "config/config_types.hpp"

#include <sys/types.h>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace MediaShuttle::Config
{

//------------------------------------------------------------------------------//
// Error Handling for Configuration Loading
//------------------------------------------------------------------------------//

enum class LoadError {
    FileNotFound,
    JsonParseError,
    ValidationError,
};

using LoadResult   = std::expected<ServiceConfig, LoadError>;
using LoadErrorMsg = std::expected<ServiceConfig, std::string>;

LoadResult loadConfigFromFile(const std::filesystem::path &file_path);
LoadResult loadConfigFromString(const std::string &json_text);
LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path);

// Overrides pane roots and ownership from DOWNLOAD_PATH, MEDIA_PATH, PUID and PGID.
void ApplyEnvironmentOverrides(ServiceConfig &config);

// Parses a size string (e.g., "500MB", "2GB", "1024") into bytes.
std::optional<std::uint64_t> ParseSizeStringToBytes(const std::string &size_str);

// Parses an octal permission string ("0755", "755").
std::optional<mode_t> ParseModeString(const std::string &mode_str);

}  // namespace MediaShuttle::Config

#endif  // MEDIASHUTTLE_SRC_CONFIG_CONFIG_LOADER_HPP_

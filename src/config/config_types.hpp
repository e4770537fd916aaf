#ifndef MEDIASHUTTLE_SRC_CONFIG_CONFIG_TYPES_HPP_
#define MEDIASHUTTLE_SRC_CONFIG_CONFIG_TYPES_HPP_

#include "app_constants.hpp"

#include <spdlog/spdlog.h>
#include <sys/types.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace MediaShuttle::Config
{

//------------------------------------------------------------------------------//
// Enumerations for Configuration Types
//------------------------------------------------------------------------------//

enum class Pane : std::uint8_t { Downloads, Media };

std::optional<Pane> StringToPane(const std::string &pane_str);
const char *PaneToString(Pane pane);

// Function to convert string to spdlog::level::level_enum
std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str);

//------------------------------------------------------------------------------//
// Structs for Configuration Types
//------------------------------------------------------------------------------//

struct GlobalSettings {
    spdlog::level::level_enum log_level = Constants::DEFAULT_LOG_LEVEL;
    std::string listen_address          = std::string(Constants::DEFAULT_LISTEN_ADDRESS);
    std::uint16_t listen_port           = Constants::DEFAULT_LISTEN_PORT;
    std::size_t worker_threads          = Constants::DEFAULT_WORKER_THREADS;

    bool IsValid() const;
};

struct PermissionSettings {
    bool enabled       = true;
    mode_t dir_mode    = Constants::DEFAULT_DIR_MODE;
    mode_t file_mode   = Constants::DEFAULT_FILE_MODE;
    std::optional<uid_t> uid;  ///< Owner applied to created entries, unchanged if unset
    std::optional<gid_t> gid;  ///< Group applied to created entries, unchanged if unset

    bool IsValid() const;
};

struct TransferSettings {
    std::size_t chunk_size_bytes                = Constants::DEFAULT_COPY_CHUNK_SIZE;
    std::chrono::milliseconds progress_interval = Constants::DEFAULT_PROGRESS_INTERVAL;

    bool IsValid() const;
};

struct ServiceConfig {
    std::filesystem::path downloads_path = std::string(Constants::DEFAULT_DOWNLOADS_PATH);
    std::filesystem::path media_path     = std::string(Constants::DEFAULT_MEDIA_PATH);
    GlobalSettings global_settings;
    PermissionSettings permissions;
    TransferSettings transfer;

    const std::filesystem::path &PanePath(Pane pane) const
    {
        return pane == Pane::Downloads ? downloads_path : media_path;
    }

    bool IsValid() const;
};

//------------------------------------------------------------------------------//
// Implementation of Enum / Logging Conversion Functions
//------------------------------------------------------------------------------//

inline std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str)
{
    if (level_str == "trace") {
        return spdlog::level::trace;
    }
    if (level_str == "debug") {
        return spdlog::level::debug;
    }
    if (level_str == "info") {
        return spdlog::level::info;
    }
    if (level_str == "warn") {
        return spdlog::level::warn;
    }
    if (level_str == "error") {
        return spdlog::level::err;
    }
    if (level_str == "fatal" || level_str == "critical") {
        return spdlog::level::critical;
    }
    if (level_str == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

inline std::optional<Pane> StringToPane(const std::string &pane_str)
{
    if (pane_str == "downloads") {
        return Pane::Downloads;
    }
    if (pane_str == "media") {
        return Pane::Media;
    }
    return std::nullopt;
}

inline const char *PaneToString(Pane pane)
{
    switch (pane) {
        case Pane::Downloads:
            return "downloads";
        case Pane::Media:
            return "media";
        default:
            return "unknown";
    }
}

//------------------------------------------------------------------------------//
// Implementation of Configuration Structs Functions
//------------------------------------------------------------------------------//

inline bool GlobalSettings::IsValid() const
{
    if (listen_address.empty()) {
        return false;
    }
    if (worker_threads == 0) {
        spdlog::error("worker_threads must be at least 1.");
        return false;
    }
    return true;
}

inline bool PermissionSettings::IsValid() const
{
    if ((dir_mode & ~static_cast<mode_t>(07777)) != 0 ||
        (file_mode & ~static_cast<mode_t>(07777)) != 0) {
        spdlog::error("Permission modes must fit in 07777 (dir={:o}, file={:o}).", dir_mode, file_mode);
        return false;
    }
    if (gid.has_value() && !uid.has_value()) {
        spdlog::warn("gid specified without uid; only the group will be changed.");
    }
    return true;
}

inline bool TransferSettings::IsValid() const
{
    if (chunk_size_bytes == 0) {
        return false;
    }
    if (progress_interval.count() < 0) {
        return false;
    }
    return true;
}

inline bool ServiceConfig::IsValid() const
{
    if (downloads_path.empty() || media_path.empty()) {
        return false;
    }
    return global_settings.IsValid() && permissions.IsValid() && transfer.IsValid();
}

}  // namespace MediaShuttle::Config

#endif  // MEDIASHUTTLE_SRC_CONFIG_CONFIG_TYPES_HPP_

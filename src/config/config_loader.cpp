#include "config_loader.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>
#include "config_types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <unordered_map>

#define TRY_ASSIGN(target, json_obj, key, type)                            \
    try {                                                                  \
        if (json_obj.contains(key)) {                                      \
            target = json_obj.at(key).get<type>();                         \
        }                                                                  \
    } catch (const nlohmann::json::exception &e) {                         \
        spdlog::error("JSON parse error for key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                 \
    }

namespace MediaShuttle::Config
{

namespace
{

std::optional<std::uint64_t> ParseUnsigned(const std::string &text)
{
    std::uint64_t value = 0;
    auto conv_res       = std::from_chars(text.data(), text.data() + text.size(), value);
    if (conv_res.ec != std::errc() || conv_res.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// Accepts either an octal string or a plain integer for a mode field.
std::expected<mode_t, LoadError> ReadMode(
    const nlohmann::json &obj, const char *key, mode_t fallback
)
{
    if (!obj.contains(key)) {
        return fallback;
    }
    const auto &value = obj.at(key);
    if (value.is_string()) {
        auto mode_opt = ParseModeString(value.get<std::string>());
        if (!mode_opt) {
            spdlog::error("Invalid octal mode for '{}': {}", key, value.get<std::string>());
            return std::unexpected(LoadError::ValidationError);
        }
        return *mode_opt;
    }
    if (value.is_number_unsigned()) {
        return static_cast<mode_t>(value.get<std::uint32_t>());
    }
    spdlog::error("'{}' must be an octal string or a non-negative integer.", key);
    return std::unexpected(LoadError::ValidationError);
}

LoadResult ParseConfigJson(const nlohmann::json &j)
{
    if (!j.is_object()) {
        spdlog::error("Configuration root must be a JSON object.");
        return std::unexpected(LoadError::ValidationError);
    }

    ServiceConfig config;

    // Pane roots
    std::string downloads_str = config.downloads_path.string();
    std::string media_str     = config.media_path.string();
    TRY_ASSIGN(downloads_str, j, "downloads_path", std::string);
    TRY_ASSIGN(media_str, j, "media_path", std::string);
    config.downloads_path = downloads_str;
    config.media_path     = media_str;

    if (j.contains("global_settings")) {
        const auto &gs = j.at("global_settings");
        if (!gs.is_object()) {
            spdlog::error("'global_settings' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        std::string log_level_str =
            spdlog::level::to_string_view(Constants::DEFAULT_LOG_LEVEL).data();
        TRY_ASSIGN(log_level_str, gs, "log_level", std::string);
        if (!log_level_str.empty()) {
            auto level_opt = StringToLogLevel(log_level_str);
            if (!level_opt) {
                spdlog::error(
                    "Invalid 'log_level' value: {}. Using default '{}'.", log_level_str,
                    spdlog::level::to_string_view(config.global_settings.log_level)
                );
            } else {
                config.global_settings.log_level = *level_opt;
            }
        }
        TRY_ASSIGN(config.global_settings.listen_address, gs, "listen_address", std::string);
        TRY_ASSIGN(config.global_settings.listen_port, gs, "listen_port", std::uint16_t);
        TRY_ASSIGN(config.global_settings.worker_threads, gs, "worker_threads", std::size_t);
    }
    if (!config.global_settings.IsValid()) {
        spdlog::error("Global settings are invalid.");
        return std::unexpected(LoadError::ValidationError);
    }
    spdlog::info(
        "Global settings: log_level='{}', listen={}:{}, workers={}",
        spdlog::level::to_string_view(config.global_settings.log_level),
        config.global_settings.listen_address, config.global_settings.listen_port,
        config.global_settings.worker_threads
    );

    if (j.contains("permissions")) {
        const auto &ps = j.at("permissions");
        if (!ps.is_object()) {
            spdlog::error("'permissions' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        TRY_ASSIGN(config.permissions.enabled, ps, "enabled", bool);

        auto dir_mode = ReadMode(ps, "dir_mode", config.permissions.dir_mode);
        if (!dir_mode) {
            return std::unexpected(dir_mode.error());
        }
        config.permissions.dir_mode = *dir_mode;

        auto file_mode = ReadMode(ps, "file_mode", config.permissions.file_mode);
        if (!file_mode) {
            return std::unexpected(file_mode.error());
        }
        config.permissions.file_mode = *file_mode;

        if (ps.contains("uid")) {
            std::uint32_t uid = 0;
            TRY_ASSIGN(uid, ps, "uid", std::uint32_t);
            config.permissions.uid = static_cast<uid_t>(uid);
        }
        if (ps.contains("gid")) {
            std::uint32_t gid = 0;
            TRY_ASSIGN(gid, ps, "gid", std::uint32_t);
            config.permissions.gid = static_cast<gid_t>(gid);
        }
    }
    if (!config.permissions.IsValid()) {
        spdlog::error("Permission settings are invalid.");
        return std::unexpected(LoadError::ValidationError);
    }

    if (j.contains("transfer")) {
        const auto &ts = j.at("transfer");
        if (!ts.is_object()) {
            spdlog::error("'transfer' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        if (ts.contains("chunk_size")) {
            if (ts.at("chunk_size").is_string()) {
                std::string chunk_str;
                TRY_ASSIGN(chunk_str, ts, "chunk_size", std::string);
                auto parsed_bytes = ParseSizeStringToBytes(chunk_str);
                if (!parsed_bytes.has_value()) {
                    spdlog::error("Invalid 'chunk_size' string: '{}'", chunk_str);
                    return std::unexpected(LoadError::ValidationError);
                }
                config.transfer.chunk_size_bytes = static_cast<std::size_t>(*parsed_bytes);
            } else if (ts.at("chunk_size").is_number_unsigned()) {
                TRY_ASSIGN(config.transfer.chunk_size_bytes, ts, "chunk_size", std::size_t);
            } else {
                spdlog::error("'chunk_size' must be a string or a non-negative number.");
                return std::unexpected(LoadError::ValidationError);
            }
        }
        if (ts.contains("progress_interval_ms")) {
            std::int64_t interval_ms = 0;
            TRY_ASSIGN(interval_ms, ts, "progress_interval_ms", std::int64_t);
            config.transfer.progress_interval = std::chrono::milliseconds(interval_ms);
        }
    }
    if (!config.transfer.IsValid()) {
        spdlog::error("Transfer settings are invalid.");
        return std::unexpected(LoadError::ValidationError);
    }
    spdlog::info(
        "Transfer settings: chunk_size={} bytes, progress_interval={}ms",
        config.transfer.chunk_size_bytes, config.transfer.progress_interval.count()
    );

    if (!config.IsValid()) {
        spdlog::error("Overall service configuration is invalid after parsing.");
        return std::unexpected(LoadError::ValidationError);
    }
    return config;
}

}  // namespace

std::optional<std::uint64_t> ParseSizeStringToBytes(const std::string &size_str)
{
    if (size_str.empty()) {
        return std::nullopt;
    }

    std::string num_part;
    std::string unit_part;

    size_t i = 0;
    while (i < size_str.length() && std::isdigit(static_cast<unsigned char>(size_str[i]))) {
        num_part += size_str[i];
        i++;
    }

    // Allow optional space between number and unit
    while (i < size_str.length() && std::isspace(static_cast<unsigned char>(size_str[i]))) {
        i++;
    }

    while (i < size_str.length() && std::isalpha(static_cast<unsigned char>(size_str[i]))) {
        unit_part += size_str[i];
        i++;
    }

    if (i < size_str.length()) {
        spdlog::warn("Invalid characters found after unit in size string: '{}'", size_str);
        return std::nullopt;
    }

    if (num_part.empty()) {
        spdlog::warn("No numeric part in size string: '{}'", size_str);
        return std::nullopt;
    }

    auto value_opt = ParseUnsigned(num_part);
    if (!value_opt) {
        spdlog::warn("Failed to parse numeric part '{}' of size string: '{}'", num_part, size_str);
        return std::nullopt;
    }
    std::uint64_t value = *value_opt;

    if (unit_part.empty()) {  // Assume bytes if no unit
        return value;
    }

    std::ranges::transform(unit_part, unit_part.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    static const std::unordered_map<std::string, std::uint64_t> unit_multipliers = {
        { "b",                           1},
        {"kb",                     1024ULL},
        { "k",                     1024ULL},
        {"mb",           1024ULL * 1024ULL},
        { "m",           1024ULL * 1024ULL},
        {"gb", 1024ULL * 1024ULL * 1024ULL},
        { "g", 1024ULL * 1024ULL * 1024ULL}
    };
    auto it = unit_multipliers.find(unit_part);
    if (it == unit_multipliers.end()) {
        spdlog::warn("Unknown size unit '{}' in string '{}'", unit_part, size_str);
        return std::nullopt;
    }
    return value * it->second;
}

std::optional<mode_t> ParseModeString(const std::string &mode_str)
{
    if (mode_str.empty() || mode_str.size() > 5) {
        return std::nullopt;
    }
    unsigned int mode = 0;
    auto conv_res = std::from_chars(mode_str.data(), mode_str.data() + mode_str.size(), mode, 8);
    if (conv_res.ec != std::errc() || conv_res.ptr != mode_str.data() + mode_str.size()) {
        return std::nullopt;
    }
    if (mode > 07777) {
        return std::nullopt;
    }
    return static_cast<mode_t>(mode);
}

void ApplyEnvironmentOverrides(ServiceConfig &config)
{
    if (const char *downloads = std::getenv(Constants::ENV_DOWNLOADS_PATH.data());
        downloads && *downloads) {
        config.downloads_path = downloads;
        spdlog::info("Downloads root overridden from environment: {}", downloads);
    }
    if (const char *media = std::getenv(Constants::ENV_MEDIA_PATH.data()); media && *media) {
        config.media_path = media;
        spdlog::info("Media root overridden from environment: {}", media);
    }
    if (const char *puid = std::getenv(Constants::ENV_OWNER_UID.data()); puid && *puid) {
        if (auto uid = ParseUnsigned(puid); uid) {
            config.permissions.uid = static_cast<uid_t>(*uid);
        } else {
            spdlog::warn("Ignoring non-numeric {}='{}'", Constants::ENV_OWNER_UID, puid);
        }
    }
    if (const char *pgid = std::getenv(Constants::ENV_OWNER_GID.data()); pgid && *pgid) {
        if (auto gid = ParseUnsigned(pgid); gid) {
            config.permissions.gid = static_cast<gid_t>(*gid);
        } else {
            spdlog::warn("Ignoring non-numeric {}='{}'", Constants::ENV_OWNER_GID, pgid);
        }
    }
}

LoadResult loadConfigFromString(const std::string &json_text)
{
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::error("Failed to parse JSON config: {}", e.what());
        return std::unexpected(LoadError::JsonParseError);
    }
    return ParseConfigJson(j);
}

LoadResult loadConfigFromFile(const std::filesystem::path &file_path)
{
    spdlog::info("Attempting to load configuration from: {}", file_path.string());

    std::ifstream config_stream(file_path);
    if (!config_stream.is_open()) {
        spdlog::error("Failed to open config file: {}", file_path.string());
        return std::unexpected(LoadError::FileNotFound);
    }

    nlohmann::json j;
    try {
        config_stream >> j;
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::error("Failed to parse JSON config file: {}", e.what());
        return std::unexpected(LoadError::JsonParseError);
    }

    auto result = ParseConfigJson(j);
    if (result) {
        spdlog::info(
            "Configuration loaded: downloads='{}', media='{}'", result->downloads_path.string(),
            result->media_path.string()
        );
    }
    return result;
}

LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path)
{
    auto result = loadConfigFromFile(file_path);
    if (result.has_value()) {
        return result.value();
    }
    std::string error_message = "Failed to load config (" + file_path.string() + "): ";
    switch (result.error()) {
        case LoadError::FileNotFound:
            error_message += "File not found.";
            break;
        case LoadError::JsonParseError:
            error_message += "JSON parsing failed.";
            break;
        case LoadError::ValidationError:
            error_message += "Configuration validation failed.";
            break;
        default:
            error_message += "Unknown error.";
            break;
    }
    return std::unexpected(error_message);
}

}  // namespace MediaShuttle::Config

#ifndef MEDIASHUTTLE_SRC_APP_CONSTANTS_HPP_
#define MEDIASHUTTLE_SRC_APP_CONSTANTS_HPP_

#include <spdlog/common.h>
#include <sys/types.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace MediaShuttle::Constants
{
// Application Info
constexpr std::string_view APP_NAME = "MediaShuttle";
constexpr std::string_view APP_VERSION_STRING = "MediaShuttle version 0.1.0";
constexpr std::string_view APP_VERSION_SHORT  = "0.1.0";

// Logging
constexpr spdlog::level::level_enum DEFAULT_LOG_LEVEL   = spdlog::level::info;
constexpr spdlog::level::level_enum DEFAULT_FLUSH_LEVEL = spdlog::level::warn;
constexpr std::string_view DEFAULT_CONSOLE_LOG_PATTERN =
    "[%Y-%m-%d %H:%M:%S.%e] [ThreadID:%t] [%^%l%$] [%n] %v";

// Panes
constexpr std::string_view DEFAULT_DOWNLOADS_PATH = "/data/downloads";
constexpr std::string_view DEFAULT_MEDIA_PATH     = "/data/media";
constexpr std::string_view ENV_DOWNLOADS_PATH     = "DOWNLOAD_PATH";
constexpr std::string_view ENV_MEDIA_PATH         = "MEDIA_PATH";
constexpr std::string_view ENV_OWNER_UID          = "PUID";
constexpr std::string_view ENV_OWNER_GID          = "PGID";

// HTTP
constexpr std::string_view DEFAULT_LISTEN_ADDRESS = "0.0.0.0";
constexpr std::uint16_t DEFAULT_LISTEN_PORT       = 3000;
constexpr std::size_t DEFAULT_WORKER_THREADS      = 4;
constexpr std::size_t MAX_REQUEST_BODY_BYTES      = 8ULL * 1024ULL * 1024ULL;

// Permissions (NAS friendly defaults)
constexpr mode_t DEFAULT_DIR_MODE  = 0777;
constexpr mode_t DEFAULT_FILE_MODE = 0666;

// Transfer
constexpr std::size_t DEFAULT_COPY_CHUNK_SIZE                  = 1024ULL * 1024ULL;
constexpr std::chrono::milliseconds DEFAULT_PROGRESS_INTERVAL = std::chrono::milliseconds(100);
constexpr double THROUGHPUT_EMA_ALPHA                          = 0.3;

}  // namespace MediaShuttle::Constants

#endif  // MEDIASHUTTLE_SRC_APP_CONSTANTS_HPP_

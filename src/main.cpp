#include "api/file_manager.hpp"
#include "app_constants.hpp"
#include "config/config_loader.hpp"
#include "config/config_types.hpp"
#include "server/http_server.hpp"
#include "storage/permission_normalizer.hpp"
#include "transfer/transfer_orchestrator.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

int main(int argc, char *argv[])
{
    // Command Line argument parsing
    CLI::App app{std::string(MediaShuttle::Constants::APP_NAME)};

    std::string config_path_str;
    std::string downloads_override;
    std::string media_override;
    std::optional<std::uint16_t> port_override;
    std::string log_level_override;

    app.add_option("-c,--config", config_path_str, "Path to the configuration JSON file")
        ->check(CLI::ExistingFile);
    app.add_option("--downloads", downloads_override, "Downloads (source) root directory");
    app.add_option("--media", media_override, "Media (destination) root directory");
    app.add_option("-p,--port", port_override, "TCP port to listen on");
    app.add_option("--log-level", log_level_override, "trace|debug|info|warn|error|critical|off");

    app.set_version_flag("-v,--version", std::string(MediaShuttle::Constants::APP_VERSION_STRING));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    // Initialize default logger (console) before config is parsed
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern(std::string(MediaShuttle::Constants::DEFAULT_CONSOLE_LOG_PATTERN));
        auto main_logger = std::make_shared<spdlog::logger>(
            std::string(MediaShuttle::Constants::APP_NAME), console_sink
        );
        spdlog::set_default_logger(main_logger);
        spdlog::set_level(MediaShuttle::Constants::DEFAULT_LOG_LEVEL);
        spdlog::flush_on(MediaShuttle::Constants::DEFAULT_FLUSH_LEVEL);
    } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    spdlog::info("{} starting...", MediaShuttle::Constants::APP_NAME);

    // Load Configuration
    MediaShuttle::Config::ServiceConfig config;
    if (!config_path_str.empty()) {
        auto config_result =
            MediaShuttle::Config::loadConfigFromFileVerbose(std::filesystem::path(config_path_str));
        if (!config_result) {
            spdlog::critical("Error loading configuration: {}", config_result.error());
            return EXIT_FAILURE;
        }
        config = std::move(config_result.value());
    } else {
        spdlog::info("No configuration file given, using defaults");
    }

    MediaShuttle::Config::ApplyEnvironmentOverrides(config);
    if (!downloads_override.empty()) {
        config.downloads_path = downloads_override;
    }
    if (!media_override.empty()) {
        config.media_path = media_override;
    }
    if (port_override) {
        config.global_settings.listen_port = *port_override;
    }
    if (!log_level_override.empty()) {
        auto level_opt = MediaShuttle::Config::StringToLogLevel(log_level_override);
        if (!level_opt) {
            spdlog::critical("Invalid --log-level value: {}", log_level_override);
            return EXIT_FAILURE;
        }
        config.global_settings.log_level = *level_opt;
    }
    if (!config.IsValid()) {
        spdlog::critical("Configuration is invalid after applying overrides");
        return EXIT_FAILURE;
    }

    // Initialize Logging Level from Config
    spdlog::set_level(config.global_settings.log_level);
    spdlog::info(
        "Logging level set to: {}", spdlog::level::to_string_view(config.global_settings.log_level)
    );
    spdlog::info(
        "Downloads root: {}, media root: {}", config.downloads_path.string(),
        config.media_path.string()
    );

    // Setup Core Components
    int exit_code = EXIT_SUCCESS;
    try {
        MediaShuttle::Storage::PermissionNormalizer normalizer(config.permissions);
        MediaShuttle::Transfer::TransferOrchestrator orchestrator(config, normalizer);
        MediaShuttle::Api::FileManager file_manager(config, normalizer);
        MediaShuttle::Server::HttpServer server(config, orchestrator, file_manager);

        server.Listen();
        server.Run();
    } catch (const std::exception &e) {
        spdlog::critical("Server error: {}", e.what());
        exit_code = EXIT_FAILURE;
    }

    spdlog::info("{} exiting...", MediaShuttle::Constants::APP_NAME);
    spdlog::shutdown();

    return exit_code;
}

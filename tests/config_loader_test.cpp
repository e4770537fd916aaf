#include "config/config_loader.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <cstdlib>

namespace MediaShuttle::Config
{
namespace
{

TEST(ConfigLoaderTest, DefaultsForEmptyObject)
{
    auto res = loadConfigFromString("{}");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->downloads_path, "/data/downloads");
    EXPECT_EQ(res->media_path, "/data/media");
    EXPECT_EQ(res->global_settings.listen_port, 3000);
    EXPECT_EQ(res->global_settings.worker_threads, 4u);
    EXPECT_TRUE(res->permissions.enabled);
    EXPECT_EQ(res->permissions.dir_mode, 0777u);
    EXPECT_EQ(res->permissions.file_mode, 0666u);
    EXPECT_FALSE(res->permissions.uid.has_value());
    EXPECT_EQ(res->transfer.chunk_size_bytes, 1024u * 1024u);
    EXPECT_EQ(res->transfer.progress_interval.count(), 100);
}

TEST(ConfigLoaderTest, ParsesFullDocument)
{
    auto res = loadConfigFromString(R"({
        "downloads_path": "/srv/downloads",
        "media_path": "/srv/media",
        "global_settings": {"log_level": "debug", "listen_address": "127.0.0.1",
                            "listen_port": 8080, "worker_threads": 8},
        "permissions": {"enabled": true, "uid": 99, "gid": 100,
                        "dir_mode": "0755", "file_mode": 420},
        "transfer": {"chunk_size": "4MB", "progress_interval_ms": 250}
    })");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->downloads_path, "/srv/downloads");
    EXPECT_EQ(res->media_path, "/srv/media");
    EXPECT_EQ(res->global_settings.log_level, spdlog::level::debug);
    EXPECT_EQ(res->global_settings.listen_address, "127.0.0.1");
    EXPECT_EQ(res->global_settings.listen_port, 8080);
    EXPECT_EQ(res->global_settings.worker_threads, 8u);
    EXPECT_EQ(res->permissions.uid, 99u);
    EXPECT_EQ(res->permissions.gid, 100u);
    EXPECT_EQ(res->permissions.dir_mode, 0755u);
    EXPECT_EQ(res->permissions.file_mode, 0644u);
    EXPECT_EQ(res->transfer.chunk_size_bytes, 4u * 1024u * 1024u);
    EXPECT_EQ(res->transfer.progress_interval.count(), 250);
}

TEST(ConfigLoaderTest, RejectsInvalidDocuments)
{
    EXPECT_EQ(loadConfigFromString("{not json").error(), LoadError::JsonParseError);
    EXPECT_EQ(loadConfigFromString("[]").error(), LoadError::ValidationError);
    EXPECT_EQ(
        loadConfigFromString(R"({"global_settings": {"listen_port": "http"}})").error(),
        LoadError::JsonParseError
    );
    EXPECT_EQ(
        loadConfigFromString(R"({"global_settings": {"worker_threads": 0}})").error(),
        LoadError::ValidationError
    );
    EXPECT_EQ(
        loadConfigFromString(R"({"permissions": {"dir_mode": "0999"}})").error(),
        LoadError::ValidationError
    );
    EXPECT_EQ(
        loadConfigFromString(R"({"transfer": {"chunk_size": "12XB"}})").error(),
        LoadError::ValidationError
    );
    EXPECT_EQ(
        loadConfigFromString(R"({"transfer": {"chunk_size": 0}})").error(),
        LoadError::ValidationError
    );
}

TEST(ConfigLoaderTest, FileLoading)
{
    Testing::TempDir temp;
    Testing::WriteFile(temp.Path() / "config.json", R"({"media_path": "/mnt/media"})");

    auto res = loadConfigFromFile(temp.Path() / "config.json");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->media_path, "/mnt/media");

    auto missing = loadConfigFromFile(temp.Path() / "absent.json");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), LoadError::FileNotFound);

    auto verbose = loadConfigFromFileVerbose(temp.Path() / "absent.json");
    ASSERT_FALSE(verbose.has_value());
    EXPECT_NE(verbose.error().find("File not found"), std::string::npos);
}

TEST(ConfigLoaderTest, EnvironmentOverrides)
{
    ::setenv("DOWNLOAD_PATH", "/env/downloads", 1);
    ::setenv("MEDIA_PATH", "/env/media", 1);
    ::setenv("PUID", "1000", 1);
    ::setenv("PGID", "not-a-number", 1);

    ServiceConfig config;
    ApplyEnvironmentOverrides(config);

    ::unsetenv("DOWNLOAD_PATH");
    ::unsetenv("MEDIA_PATH");
    ::unsetenv("PUID");
    ::unsetenv("PGID");

    EXPECT_EQ(config.downloads_path, "/env/downloads");
    EXPECT_EQ(config.media_path, "/env/media");
    EXPECT_EQ(config.permissions.uid, 1000u);
    EXPECT_FALSE(config.permissions.gid.has_value());
}

TEST(ConfigLoaderTest, SizeStrings)
{
    EXPECT_EQ(ParseSizeStringToBytes("1024"), 1024u);
    EXPECT_EQ(ParseSizeStringToBytes("1 KB"), 1024u);
    EXPECT_EQ(ParseSizeStringToBytes("2mb"), 2u * 1024u * 1024u);
    EXPECT_EQ(ParseSizeStringToBytes("1G"), 1024ull * 1024ull * 1024ull);
    EXPECT_FALSE(ParseSizeStringToBytes("").has_value());
    EXPECT_FALSE(ParseSizeStringToBytes("MB").has_value());
    EXPECT_FALSE(ParseSizeStringToBytes("5TB").has_value());
}

TEST(ConfigLoaderTest, ModeStrings)
{
    EXPECT_EQ(ParseModeString("0755"), 0755u);
    EXPECT_EQ(ParseModeString("644"), 0644u);
    EXPECT_FALSE(ParseModeString("").has_value());
    EXPECT_FALSE(ParseModeString("0789").has_value());
    EXPECT_FALSE(ParseModeString("017777").has_value());
}

}  // namespace
}  // namespace MediaShuttle::Config

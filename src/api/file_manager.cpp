#include "api/file_manager.hpp"

#include "api/request_parser.hpp"

#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace MediaShuttle::Api
{

namespace fs = std::filesystem;

namespace
{

// Lowercased text after the last dot; dotfiles and names without one have none.
std::string Extension(const std::string &name)
{
    const auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return {};
    }
    std::string ext = name.substr(dot + 1);
    std::ranges::transform(ext, ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

// UTC, millisecond precision: 2024-05-01T12:00:00.000Z
std::string FormatTimestamp(const struct timespec &ts)
{
    std::tm utc{};
    const std::time_t seconds = ts.tv_sec;
    ::gmtime_r(&seconds, &utc);
    char buffer[32];
    const auto len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    char millis[8];
    std::snprintf(millis, sizeof(millis), ".%03ldZ", static_cast<long>(ts.tv_nsec / 1000000));
    return std::string(buffer, len) + millis;
}

std::string PanePathOf(const fs::path &root, const fs::path &absolute)
{
    const auto relative = absolute.lexically_relative(root).generic_string();
    return relative.empty() || relative == "." ? std::string("/") : "/" + relative;
}

bool NameLess(const std::string &a, const std::string &b)
{
    const auto folded = std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) {
            return std::tolower(x) < std::tolower(y);
        }
    );
    if (folded) {
        return true;
    }
    const auto folded_reverse = std::lexicographical_compare(
        b.begin(), b.end(), a.begin(), a.end(),
        [](unsigned char x, unsigned char y) {
            return std::tolower(x) < std::tolower(y);
        }
    );
    return !folded_reverse && a < b;
}

}  // namespace

ApiResponse ApiResponse::Ok(nlohmann::json body)
{
    body["success"] = true;
    return ApiResponse{200, std::move(body)};
}

ApiResponse ApiResponse::Fail(unsigned status, std::string error)
{
    return ApiResponse{
        status, nlohmann::json{{"success", false}, {"error", std::move(error)}}
    };
}

FileManager::FileManager(
    const Config::ServiceConfig &config, Storage::IPermissionNormalizer &normalizer
)
    : config_(config), materializer_(normalizer)
{
}

bool FileManager::IsValidFolderName(const std::string &name)
{
    static constexpr std::string_view kForbidden = "<>:\"/\\|?*";
    if (name.empty()) {
        return false;
    }
    for (const char c : name) {
        if (static_cast<unsigned char>(c) < 0x20 || kForbidden.find(c) != std::string_view::npos) {
            return false;
        }
    }
    return true;
}

std::optional<Storage::PathResolver> FileManager::OpenPane(
    Config::Pane pane, ApiResponse &failure
) const
{
    Storage::PathResolver resolver(config_.PanePath(pane));
    if (auto res = resolver.Initialize(); !res) {
        spdlog::error(
            "{} root {} unavailable: {}", Config::PaneToString(pane),
            config_.PanePath(pane).string(), res.error().message()
        );
        failure = ApiResponse::Fail(500, std::string(Config::PaneToString(pane)) + " root unavailable");
        return std::nullopt;
    }
    return resolver;
}

//------------------------------------------------------------------------------//
// Conflict Check
//------------------------------------------------------------------------------//

ApiResponse FileManager::CheckExists(const nlohmann::json &body)
{
    const auto sources = body.find("sourcePaths");
    if (!body.is_object() || sources == body.end() || !sources->is_array() || sources->empty()) {
        return ApiResponse::Fail(400, "Source paths are required");
    }
    const auto destination = body.find("destinationPath");
    if (destination == body.end() || !destination->is_string()) {
        return ApiResponse::Fail(400, "Destination path is required");
    }

    ApiResponse failure;
    auto media = OpenPane(Config::Pane::Media, failure);
    if (!media) {
        return failure;
    }
    auto folder = media->Resolve(destination->get<std::string>());
    if (!folder) {
        return ApiResponse::Fail(400, "Invalid path: " + folder.error().message());
    }

    std::vector<std::string> conflicts;
    for (const auto &source : *sources) {
        if (!source.is_string()) {
            return ApiResponse::Fail(400, "Source paths must be strings");
        }
        auto name = BaseName(source.get<std::string>());
        if (name.empty()) {
            continue;
        }
        std::error_code ec;
        if (fs::exists(fs::symlink_status(*folder / name, ec))) {
            conflicts.push_back(std::move(name));
        }
    }
    return ApiResponse::Ok(nlohmann::json{{"conflicts", conflicts}});
}

ApiResponse FileManager::CheckDestinations(const nlohmann::json &body)
{
    const auto files = body.find("files");
    if (files == body.end() || !files->is_array() || files->empty()) {
        auto failure                   = ApiResponse::Fail(400, "Files array is required");
        failure.body["existingFiles"] = nlohmann::json::array();
        return failure;
    }

    ApiResponse failure;
    auto media = OpenPane(Config::Pane::Media, failure);
    if (!media) {
        return failure;
    }

    auto existing = nlohmann::json::array();
    for (const auto &file : *files) {
        const auto source      = file.find("sourcePath");
        const auto destination = file.find("destinationPath");
        if (!file.is_object() || source == file.end() || !source->is_string() ||
            destination == file.end() || !destination->is_string()) {
            return ApiResponse::Fail(400, "Each file needs sourcePath and destinationPath strings");
        }
        const auto &destination_str = destination->get_ref<const std::string &>();
        auto sanitized = Storage::PathResolver::SanitizeDestination(destination_str);
        if (!sanitized) {
            continue;
        }
        auto target = media->Resolve(*sanitized);
        if (!target) {
            spdlog::debug("Skipping destination '{}': {}", destination_str, target.error().message());
            continue;
        }
        std::error_code ec;
        if (fs::exists(fs::symlink_status(*target, ec))) {
            existing.push_back(nlohmann::json{
                {"sourcePath", *source},
                {"destinationPath", destination_str},
                {"fileName", BaseName(*sanitized)},
            });
        }
    }
    return ApiResponse::Ok(nlohmann::json{{"existingFiles", std::move(existing)}});
}

//------------------------------------------------------------------------------//
// Listing
//------------------------------------------------------------------------------//

ApiResponse FileManager::List(const nlohmann::json &query)
{
    std::optional<Config::Pane> pane;
    if (const auto it = query.find("pane"); it != query.end() && it->is_string()) {
        pane = Config::StringToPane(it->get<std::string>());
    }
    if (!pane) {
        return ApiResponse::Fail(400, "Invalid pane parameter");
    }
    std::string requested = "/";
    if (const auto it = query.find("path");
        it != query.end() && it->is_string() && !it->get_ref<const std::string &>().empty()) {
        requested = it->get<std::string>();
    }

    ApiResponse failure;
    auto resolver = OpenPane(*pane, failure);
    if (!resolver) {
        return failure;
    }
    auto directory = resolver->Resolve(requested);
    if (!directory) {
        return ApiResponse::Fail(400, "Invalid path: " + directory.error().message());
    }

    std::error_code ec;
    const auto status = fs::status(*directory, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return ApiResponse::Fail(404, "Path not found");
        }
        return ApiResponse::Fail(500, ec.message());
    }
    if (!fs::is_directory(status)) {
        return ApiResponse::Fail(400, "Path is not a directory");
    }

    struct Listed {
        std::string name;
        bool is_directory = false;
        nlohmann::json entry;
    };
    std::vector<Listed> listed;

    fs::directory_iterator it(*directory, ec);
    if (ec) {
        spdlog::warn("Cannot list {}: {}", directory->string(), ec.message());
        return ApiResponse::Fail(500, ec.message());
    }
    const fs::directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        const auto &entry_path = it->path();
        struct stat st {};
        if (::stat(entry_path.c_str(), &st) == -1) {
            // Dangling links and entries we may not stat are left out
            spdlog::debug("Skipping {}: errno {}", entry_path.string(), errno);
            continue;
        }
        const bool is_directory = S_ISDIR(st.st_mode);
        auto name               = entry_path.filename().string();

        nlohmann::json entry{
            {"name", name},
            {"path", PanePathOf(resolver->GetRoot(), entry_path)},
            {"type", is_directory ? "directory" : "file"},
            {"size", is_directory ? std::uint64_t{0} : static_cast<std::uint64_t>(st.st_size)},
            {"modifiedAt", FormatTimestamp(st.st_mtim)},
        };
        if (!is_directory) {
            entry["extension"] = Extension(name);
        }
        listed.push_back(Listed{std::move(name), is_directory, std::move(entry)});
    }
    if (ec) {
        spdlog::warn("Listing of {} stopped early: {}", directory->string(), ec.message());
    }

    std::ranges::sort(listed, [](const Listed &a, const Listed &b) {
        if (a.is_directory != b.is_directory) {
            return a.is_directory;
        }
        return NameLess(a.name, b.name);
    });

    auto entries = nlohmann::json::array();
    for (auto &item : listed) {
        entries.push_back(std::move(item.entry));
    }
    return ApiResponse::Ok(nlohmann::json{
        {"data",
         {
             {"path", PanePathOf(resolver->GetRoot(), *directory)},
             {"entries", std::move(entries)},
         }}
    });
}

//------------------------------------------------------------------------------//
// Folder Creation
//------------------------------------------------------------------------------//

ApiResponse FileManager::CreateFolder(const nlohmann::json &body)
{
    if (!body.is_object()) {
        return ApiResponse::Fail(400, "Request body must be a JSON object");
    }
    const auto name_it = body.find("name");
    if (name_it == body.end() || !name_it->is_string() || name_it->get<std::string>().empty()) {
        return ApiResponse::Fail(400, "Folder name is required");
    }
    const auto name = name_it->get<std::string>();
    if (!IsValidFolderName(name)) {
        return ApiResponse::Fail(400, "Folder name contains invalid characters");
    }
    std::string parent_str = "/";
    if (const auto path_it = body.find("path"); path_it != body.end() && !path_it->is_null()) {
        if (!path_it->is_string()) {
            return ApiResponse::Fail(400, "Parent path must be a string");
        }
        parent_str = path_it->get<std::string>();
    }

    ApiResponse failure;
    auto media = OpenPane(Config::Pane::Media, failure);
    if (!media) {
        return failure;
    }
    auto parent = media->Resolve(parent_str);
    if (!parent) {
        return ApiResponse::Fail(400, "Invalid path: " + parent.error().message());
    }
    std::error_code ec;
    if (!fs::is_directory(*parent, ec)) {
        return ApiResponse::Fail(400, "Parent path is not a directory");
    }

    const auto target = *parent / name;
    if (fs::exists(fs::symlink_status(target, ec))) {
        return ApiResponse::Fail(409, "A folder with this name already exists");
    }
    if (auto res = materializer_.EnsureDirectory(target, media->GetRoot()); !res) {
        spdlog::warn("Could not create folder {}: {}", target.string(), res.error().message());
        return ApiResponse::Fail(500, res.error().message());
    }
    spdlog::info("Created folder {}", target.string());
    return ApiResponse::Ok(nlohmann::json{{"message", "Folder '" + name + "' created successfully"}});
}

//------------------------------------------------------------------------------//
// Deletion
//------------------------------------------------------------------------------//

ApiResponse FileManager::Delete(const nlohmann::json &body)
{
    if (!body.is_object()) {
        return ApiResponse::Fail(400, "Request body must be a JSON object");
    }
    const auto pane_it = body.find("pane");
    std::optional<Config::Pane> pane;
    if (pane_it != body.end() && pane_it->is_string()) {
        pane = Config::StringToPane(pane_it->get<std::string>());
    }
    if (!pane) {
        return ApiResponse::Fail(400, "Invalid pane parameter");
    }
    const auto paths = body.find("paths");
    if (paths == body.end() || !paths->is_array() || paths->empty()) {
        return ApiResponse::Fail(400, "Paths are required");
    }

    ApiResponse failure;
    auto resolver = OpenPane(*pane, failure);
    if (!resolver) {
        return failure;
    }

    std::vector<fs::path> targets;
    targets.reserve(paths->size());
    for (const auto &entry : *paths) {
        if (!entry.is_string()) {
            return ApiResponse::Fail(400, "Invalid path: paths must be strings");
        }
        auto target = resolver->Resolve(entry.get<std::string>());
        if (!target) {
            return ApiResponse::Fail(400, "Invalid path: " + target.error().message());
        }
        if (*target == resolver->GetRoot()) {
            return ApiResponse::Fail(400, "Invalid path: cannot delete the root folder");
        }
        targets.push_back(std::move(*target));
    }

    std::size_t deleted = 0;
    std::string errors;
    for (const auto &target : targets) {
        std::error_code ec;
        fs::remove_all(target, ec);
        if (ec) {
            spdlog::warn("Failed to delete {}: {}", target.string(), ec.message());
            if (!errors.empty()) {
                errors += "; ";
            }
            errors += "Failed to delete " + target.filename().string() + ": " + ec.message();
            continue;
        }
        ++deleted;
    }

    if (deleted == 0 && !errors.empty()) {
        return ApiResponse::Fail(500, errors);
    }
    std::string message;
    if (deleted == targets.size()) {
        message = "Deleted " + std::to_string(deleted) + (deleted == 1 ? " item" : " items") +
                  " successfully";
    } else {
        message = "Deleted " + std::to_string(deleted) + " of " + std::to_string(targets.size()) +
                  " items. Errors: " + errors;
    }
    spdlog::info("Delete in {} pane: {}", Config::PaneToString(*pane), message);
    return ApiResponse::Ok(nlohmann::json{{"message", message}});
}

}  // namespace MediaShuttle::Api

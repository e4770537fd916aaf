#ifndef MEDIASHUTTLE_SRC_STORAGE_PATH_RESOLVER_HPP_
#define MEDIASHUTTLE_SRC_STORAGE_PATH_RESOLVER_HPP_

#include "storage/storage_error.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace MediaShuttle::Storage
{

namespace fs = std::filesystem;

// Maps client supplied relative paths onto absolute paths below one base root.
// All lookups are read-only; nothing is created or modified.
class PathResolver
{
    public:
    explicit PathResolver(fs::path base_root);
    ~PathResolver() = default;

    PathResolver(const PathResolver&)            = default;
    PathResolver& operator=(const PathResolver&) = default;
    PathResolver(PathResolver&&)                 = default;
    PathResolver& operator=(PathResolver&&)      = default;

    // Canonicalizes the base root. Must succeed before Resolve is used.
    StorageResult<void> Initialize();

    const fs::path& GetRoot() const { return root_; }

    // Resolves `relative_path` below the root. Leading separators are ignored and
    // backslashes are treated as separators. Fails with PathTraversal when the
    // normalized path leaves the root and SymlinkEscape when an existing prefix
    // of it resolves outside the root.
    StorageResult<fs::path> Resolve(std::string_view relative_path) const;

    // Sanitizes first (see SanitizeDestination), then resolves.
    StorageResult<fs::path> ResolveDestination(std::string_view relative_path) const;

    // Drops empty, "." and ".." segments. Fails with InvalidPath if nothing remains.
    static StorageResult<std::string> SanitizeDestination(std::string_view relative_path);

    // Component-wise containment: true when `candidate` equals `root` or lies below it.
    static bool IsWithin(const fs::path& root, const fs::path& candidate);

    private:
    fs::path configured_root_;
    fs::path root_;
};

}  // namespace MediaShuttle::Storage

#endif  // MEDIASHUTTLE_SRC_STORAGE_PATH_RESOLVER_HPP_

#include "storage/path_resolver.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <string>
#include <system_error>
#include <utility>

namespace MediaShuttle::Storage
{

namespace
{

std::string NormalizeSeparators(std::string_view raw)
{
    std::string normalized(raw);
    std::ranges::replace(normalized, '\\', '/');
    const auto first = normalized.find_first_not_of('/');
    if (first == std::string::npos) {
        return {};
    }
    return normalized.substr(first);
}

fs::path StripTrailingSeparator(fs::path path)
{
    if (!path.has_filename() && path.has_parent_path() && path != path.root_path()) {
        return path.parent_path();
    }
    return path;
}

}  // namespace

PathResolver::PathResolver(fs::path base_root) : configured_root_(std::move(base_root)) {}

StorageResult<void> PathResolver::Initialize()
{
    std::error_code ec;
    auto canonical_root = fs::canonical(configured_root_, ec);
    if (ec) {
        spdlog::error("Base root '{}' is not accessible: {}", configured_root_.string(), ec.message());
        return std::unexpected(MapFilesystemError(ec));
    }
    if (!fs::is_directory(canonical_root, ec)) {
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }
        return std::unexpected(make_error_code(StorageErrc::NotADirectory));
    }
    root_ = std::move(canonical_root);
    return {};
}

bool PathResolver::IsWithin(const fs::path& root, const fs::path& candidate)
{
    const auto root_clean      = StripTrailingSeparator(root.lexically_normal());
    const auto candidate_clean = StripTrailingSeparator(candidate.lexically_normal());

    auto [root_it, candidate_it] = std::mismatch(
        root_clean.begin(), root_clean.end(), candidate_clean.begin(), candidate_clean.end()
    );
    return root_it == root_clean.end();
}

StorageResult<fs::path> PathResolver::Resolve(std::string_view relative_path) const
{
    if (root_.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }
    if (relative_path.find('\0') != std::string_view::npos) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    const auto normalized = NormalizeSeparators(relative_path);
    auto full_path        = StripTrailingSeparator((root_ / normalized).lexically_normal());

    if (!IsWithin(root_, full_path)) {
        spdlog::debug("Rejected traversal '{}' below '{}'", relative_path, root_.string());
        return std::unexpected(make_error_code(StorageErrc::PathTraversal));
    }

    // weakly_canonical resolves symlinks along the existing prefix only, so the
    // check also covers destinations that do not exist yet.
    std::error_code ec;
    const auto real_path = fs::weakly_canonical(full_path, ec);
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    if (!IsWithin(root_, real_path)) {
        spdlog::warn("Rejected symlink escape '{}' -> '{}'", full_path.string(), real_path.string());
        return std::unexpected(make_error_code(StorageErrc::SymlinkEscape));
    }
    return full_path;
}

StorageResult<fs::path> PathResolver::ResolveDestination(std::string_view relative_path) const
{
    auto sanitized = SanitizeDestination(relative_path);
    if (!sanitized) {
        return std::unexpected(sanitized.error());
    }
    return Resolve(*sanitized);
}

StorageResult<std::string> PathResolver::SanitizeDestination(std::string_view relative_path)
{
    if (relative_path.find('\0') != std::string_view::npos) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    std::string sanitized;
    std::string_view rest = relative_path;
    while (!rest.empty()) {
        const auto sep     = rest.find_first_of("/\\");
        const auto segment = rest.substr(0, sep);
        rest               = sep == std::string_view::npos ? std::string_view{} : rest.substr(sep + 1);

        if (segment.empty() || segment == "." || segment == "..") {
            continue;
        }
        if (!sanitized.empty()) {
            sanitized += '/';
        }
        sanitized += segment;
    }

    if (sanitized.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }
    return sanitized;
}

}  // namespace MediaShuttle::Storage

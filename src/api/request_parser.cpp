#include "api/request_parser.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace MediaShuttle::Api
{

using Transfer::FileTransferItem;
using Transfer::TransferRequest;

namespace
{

std::string JoinFolder(std::string_view folder, std::string_view name)
{
    while (!folder.empty() && (folder.back() == '/' || folder.back() == '\\')) {
        folder.remove_suffix(1);
    }
    if (folder.empty()) {
        return std::string(name);
    }
    std::string joined(folder);
    joined += '/';
    joined += name;
    return joined;
}

std::expected<void, std::string> ParseFiles(const nlohmann::json &files, TransferRequest &request)
{
    if (!files.is_array() || files.empty()) {
        return std::unexpected("files array is required");
    }
    request.files.reserve(files.size());
    for (const auto &entry : files) {
        if (!entry.is_object()) {
            return std::unexpected("each file entry must be an object");
        }
        const auto src = entry.find("sourcePath");
        const auto dst = entry.find("destinationPath");
        if (src == entry.end() || !src->is_string() || dst == entry.end() || !dst->is_string()) {
            return std::unexpected("sourcePath and destinationPath must be strings");
        }
        FileTransferItem item{src->get<std::string>(), dst->get<std::string>(), std::nullopt};
        if (const auto ow = entry.find("overwrite"); ow != entry.end() && !ow->is_null()) {
            if (!ow->is_boolean()) {
                return std::unexpected("overwrite must be a boolean");
            }
            item.overwrite = ow->get<bool>();
        }
        request.files.push_back(std::move(item));
    }
    return {};
}

std::expected<void, std::string> ParseSourcePaths(
    const nlohmann::json &body, const nlohmann::json &sources, TransferRequest &request
)
{
    if (!sources.is_array() || sources.empty()) {
        return std::unexpected("sourcePaths array is required");
    }
    const auto folder = body.find("destinationFolder");
    if (folder == body.end() || !folder->is_string()) {
        return std::unexpected("destinationFolder is required");
    }
    const auto folder_str = folder->get<std::string>();
    request.files.reserve(sources.size());
    for (const auto &source : sources) {
        if (!source.is_string()) {
            return std::unexpected("sourcePaths must contain strings");
        }
        auto source_str = source.get<std::string>();
        auto name       = BaseName(source_str);
        if (name.empty()) {
            return std::unexpected("source path has no file name: " + source_str);
        }
        request.files.push_back(
            FileTransferItem{std::move(source_str), JoinFolder(folder_str, name), std::nullopt}
        );
    }
    return {};
}

}  // namespace

std::string BaseName(std::string_view path)
{
    while (!path.empty() && (path.back() == '/' || path.back() == '\\')) {
        path.remove_suffix(1);
    }
    const auto pos = path.find_last_of("/\\");
    return std::string(pos == std::string_view::npos ? path : path.substr(pos + 1));
}

ParseResult ParseTransferRequest(const nlohmann::json &body)
{
    if (!body.is_object()) {
        return std::unexpected("request body must be a JSON object");
    }

    TransferRequest request;

    const auto op = body.find("operation");
    if (op == body.end() || !op->is_string()) {
        return std::unexpected("operation must be 'copy' or 'move'");
    }
    auto op_opt = Transfer::StringToOperation(op->get<std::string>());
    if (!op_opt) {
        return std::unexpected("operation must be 'copy' or 'move'");
    }
    request.operation = *op_opt;

    if (const auto ow = body.find("overwrite"); ow != body.end() && !ow->is_null()) {
        if (!ow->is_boolean()) {
            return std::unexpected("overwrite must be a boolean");
        }
        request.overwrite = ow->get<bool>();
    }

    std::expected<void, std::string> items;
    if (const auto files = body.find("files"); files != body.end()) {
        items = ParseFiles(*files, request);
    } else if (const auto sources = body.find("sourcePaths"); sources != body.end()) {
        items = ParseSourcePaths(body, *sources, request);
    } else {
        items = std::unexpected("files array is required");
    }
    if (!items) {
        spdlog::debug("Rejected transfer request: {}", items.error());
        return std::unexpected(items.error());
    }
    return request;
}

}  // namespace MediaShuttle::Api

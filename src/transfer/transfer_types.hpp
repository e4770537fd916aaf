#ifndef MEDIASHUTTLE_SRC_TRANSFER_TRANSFER_TYPES_HPP_
#define MEDIASHUTTLE_SRC_TRANSFER_TRANSFER_TYPES_HPP_

#include "cancellation_token.hpp"
#include "storage/path_resolver.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace MediaShuttle::Transfer
{

namespace fs = std::filesystem;

//------------------------------------------------------------------------------//
// Request
//------------------------------------------------------------------------------//

enum class TransferOperation : std::uint8_t { Copy, Move };

std::optional<TransferOperation> StringToOperation(const std::string &op_str);
const char *OperationToString(TransferOperation op);

struct FileTransferItem {
    std::string source_path;       ///< Relative to the downloads root
    std::string destination_path;  ///< Relative to the media root
    std::optional<bool> overwrite;  ///< Overrides the request default when set
};

struct TransferRequest {
    TransferOperation operation = TransferOperation::Copy;
    bool overwrite              = false;
    std::vector<FileTransferItem> files;

    bool EffectiveOverwrite(const FileTransferItem &item) const
    {
        return item.overwrite.value_or(overwrite);
    }
};

//------------------------------------------------------------------------------//
// Session
//------------------------------------------------------------------------------//

// Mutable state of one request. Lives exactly as long as its response stream.
struct TransferSession {
    TransferSession(
        Storage::PathResolver source_resolver, Storage::PathResolver destination_resolver,
        const CancellationToken &token
    )
        : source(std::move(source_resolver)),
          destination(std::move(destination_resolver)),
          cancel(token)
    {
    }

    Storage::PathResolver source;
    Storage::PathResolver destination;
    const CancellationToken &cancel;

    std::uint64_t completed = 0;
    std::uint64_t failed    = 0;
    std::vector<std::string> errors;
    std::unordered_set<std::string> created_dirs;
    std::vector<fs::path> source_parents;  ///< Parents of every valid source, for cleanup

    void RecordFailure(std::string message)
    {
        ++failed;
        errors.push_back(std::move(message));
    }
};

//------------------------------------------------------------------------------//
// Progress Protocol
//------------------------------------------------------------------------------//

struct TransferCounters {
    std::size_t current     = 0;
    std::size_t total       = 0;
    std::uint64_t completed = 0;
    std::uint64_t failed    = 0;
    std::vector<std::string> errors;
};

struct ProgressEvent {
    TransferCounters counters;
    std::string current_file;
};

struct FileProgressEvent {
    TransferCounters counters;
    std::string current_file;
    std::uint64_t bytes_copied = 0;
    std::uint64_t bytes_total  = 0;
    double bytes_per_second    = 0.0;
};

struct CompleteEvent {
    TransferCounters counters;
    std::string message;
};

struct ErrorEvent {
    TransferCounters counters;
    std::string message;
};

using TransferEvent = std::variant<ProgressEvent, FileProgressEvent, CompleteEvent, ErrorEvent>;
using EventSink     = std::function<void(const TransferEvent &)>;

// (bytes_copied, bytes_total), invoked once per copied chunk
using ByteProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

struct TransferSummary {
    std::uint64_t completed = 0;
    std::uint64_t failed    = 0;
    std::vector<std::string> errors;
    bool aborted = false;
};

//------------------------------------------------------------------------------//
// Implementation of Enum Conversion Functions
//------------------------------------------------------------------------------//

inline std::optional<TransferOperation> StringToOperation(const std::string &op_str)
{
    if (op_str == "copy") {
        return TransferOperation::Copy;
    }
    if (op_str == "move") {
        return TransferOperation::Move;
    }
    return std::nullopt;
}

inline const char *OperationToString(TransferOperation op)
{
    switch (op) {
        case TransferOperation::Copy:
            return "copy";
        case TransferOperation::Move:
            return "move";
        default:
            return "unknown";
    }
}

}  // namespace MediaShuttle::Transfer

#endif  // MEDIASHUTTLE_SRC_TRANSFER_TRANSFER_TYPES_HPP_

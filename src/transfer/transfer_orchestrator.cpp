#include "transfer/transfer_orchestrator.hpp"

#include "storage/path_resolver.hpp"
#include "transfer/cleanup_manager.hpp"
#include "transfer/progress_throttle.hpp"

#include <spdlog/spdlog.h>
#include <exception>
#include <optional>
#include <string_view>
#include <utility>

namespace MediaShuttle::Transfer
{

using Storage::MapFilesystemError;
using Storage::StorageErrc;
using Storage::StorageException;

namespace
{

// Last non-empty '/'-separated segment of a client path, or "" if there is none.
std::string LastSegment(std::string_view path)
{
    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }
    const auto pos = path.find_last_of('/');
    return std::string(pos == std::string_view::npos ? path : path.substr(pos + 1));
}

std::string DisplayName(const FileTransferItem &item)
{
    auto name = LastSegment(item.destination_path);
    return name.empty() ? item.source_path : name;
}

void Emit(const EventSink &sink, TransferEvent event)
{
    if (sink) {
        sink(event);
    }
}

}  // namespace

TransferOrchestrator::TransferOrchestrator(
    const Config::ServiceConfig &config, Storage::IPermissionNormalizer &normalizer,
    MoveHooks hooks
)
    : config_(config),
      normalizer_(normalizer),
      file_copier_(config_.transfer.chunk_size_bytes),
      materializer_(normalizer_),
      directory_copier_(file_copier_, materializer_, normalizer_),
      move_strategy_(file_copier_, directory_copier_, normalizer_, std::move(hooks))
{
}

TransferCounters TransferOrchestrator::Snapshot(
    const TransferSession &session, std::size_t current, std::size_t total
)
{
    return TransferCounters{
        .current   = current,
        .total     = total,
        .completed = session.completed,
        .failed    = session.failed,
        .errors    = session.errors,
    };
}

//------------------------------------------------------------------------------//
// Request Loop
//------------------------------------------------------------------------------//

TransferSummary TransferOrchestrator::Run(
    const TransferRequest &request, const EventSink &sink, const CancellationToken &cancel
)
{
    const std::size_t total = request.files.size();
    std::size_t started     = 0;
    std::optional<TransferSession> session;
    TransferSummary summary;

    spdlog::info(
        "Transfer started: {} of {} item(s)", OperationToString(request.operation), total
    );

    auto abort = [&](std::string message, const std::string &detail) {
        TransferCounters counters;
        if (session) {
            counters = Snapshot(*session, started, total);
        } else {
            counters.current = started;
            counters.total   = total;
        }
        if (!detail.empty()) {
            counters.errors.push_back(detail);
        }
        summary.aborted = true;
        summary.errors  = counters.errors;
        Emit(sink, ErrorEvent{std::move(counters), std::move(message)});
    };

    try {
        Storage::PathResolver source_resolver(config_.downloads_path);
        Storage::PathResolver destination_resolver(config_.media_path);
        if (auto res = source_resolver.Initialize(); !res) {
            spdlog::error(
                "Downloads root {} unavailable: {}", config_.downloads_path.string(),
                res.error().message()
            );
            throw StorageException(res.error());
        }
        if (auto res = destination_resolver.Initialize(); !res) {
            spdlog::error(
                "Media root {} unavailable: {}", config_.media_path.string(), res.error().message()
            );
            throw StorageException(res.error());
        }
        session.emplace(std::move(source_resolver), std::move(destination_resolver), cancel);

        for (std::size_t index = 0; index < total; ++index) {
            if (cancel.IsCancelled()) {
                throw StorageException(Storage::make_error_code(StorageErrc::Cancelled));
            }
            started = index + 1;
            ProcessItem(*session, request, index, sink);
        }

        if (request.operation == TransferOperation::Move && session->completed > 0) {
            const auto removed = CleanupManager::RemoveEmptyDirectories(
                session->source_parents, session->source.GetRoot()
            );
            spdlog::debug("Cleanup removed {} empty source director(ies)", removed);
        }

        std::string message = session->failed == 0
                                  ? std::string("All files processed successfully")
                                  : "Completed with " + std::to_string(session->failed) + " error(s)";
        spdlog::info(
            "Transfer finished: {} completed, {} failed", session->completed, session->failed
        );
        Emit(sink, CompleteEvent{Snapshot(*session, total, total), std::move(message)});
        summary.errors = session->errors;
    } catch (const StorageException &e) {
        if (e.code() == Storage::make_error_code(StorageErrc::Cancelled)) {
            spdlog::info("Transfer cancelled after {} of {} item(s)", started, total);
            abort("Operation cancelled", {});
        } else {
            spdlog::error("Transfer aborted: {}", e.what());
            abort("Operation failed", e.what());
        }
    } catch (const std::exception &e) {
        spdlog::error("Transfer aborted by unexpected error: {}", e.what());
        abort("Operation failed", e.what());
    }

    if (session) {
        summary.completed = session->completed;
        summary.failed    = session->failed;
    }
    return summary;
}

//------------------------------------------------------------------------------//
// Single Item
//------------------------------------------------------------------------------//

void TransferOrchestrator::ProcessItem(
    TransferSession &session, const TransferRequest &request, std::size_t index,
    const EventSink &sink
)
{
    const auto &item = request.files[index];
    const ItemContext ctx{
        .current      = index + 1,
        .total        = request.files.size(),
        .display_name = DisplayName(item),
    };
    Emit(sink, ProgressEvent{Snapshot(session, ctx.current, ctx.total), ctx.display_name});

    auto source_res = session.source.Resolve(item.source_path);
    if (!source_res || *source_res == session.source.GetRoot()) {
        spdlog::warn(
            "Rejected source '{}': {}", item.source_path,
            source_res ? "refers to the downloads root" : source_res.error().message()
        );
        session.RecordFailure("Invalid source: " + item.source_path);
        return;
    }
    const fs::path source = std::move(*source_res);
    session.source_parents.push_back(source.parent_path());

    auto destination_res = session.destination.ResolveDestination(item.destination_path);
    if (!destination_res) {
        spdlog::warn(
            "Rejected destination '{}': {}", item.destination_path,
            destination_res.error().message()
        );
        session.RecordFailure("Invalid destination: " + item.destination_path);
        return;
    }
    const fs::path destination = std::move(*destination_res);

    StorageResult<void> result;
    try {
        result = ExecuteItem(
            session, request.operation, source, destination, request.EffectiveOverwrite(item), ctx,
            sink
        );
    } catch (const StorageException &) {
        throw;
    } catch (const std::exception &e) {
        spdlog::warn("Transfer of {} raised: {}", source.string(), e.what());
        result = std::unexpected(Storage::make_error_code(StorageErrc::UnknownError));
    }

    if (result) {
        ++session.completed;
        return;
    }

    const auto &ec = result.error();
    if (ec == Storage::make_error_code(StorageErrc::Cancelled)) {
        throw StorageException(ec);
    }
    if (ec == Storage::make_error_code(StorageErrc::AlreadyExists)) {
        spdlog::info("Skipped {}: destination {} exists", source.string(), destination.string());
        session.RecordFailure("Already exists: " + LastSegment(item.destination_path));
        return;
    }
    if (ec == Storage::make_error_code(StorageErrc::InvalidPath)) {
        spdlog::warn("Refused to place {} inside itself ({})", source.string(), destination.string());
        session.RecordFailure("Invalid destination: " + item.destination_path);
        return;
    }

    auto source_name = LastSegment(item.source_path);
    spdlog::warn(
        "{} of {} to {} failed: {}", OperationToString(request.operation), source.string(),
        destination.string(), ec.message()
    );
    session.RecordFailure("Failed: " + (source_name.empty() ? item.source_path : source_name));
}

Storage::StorageResult<void> TransferOrchestrator::MaterializeParent(
    TransferSession &session, const fs::path &destination
)
{
    const auto parent = destination.parent_path();
    const auto key    = parent.string();
    if (session.created_dirs.contains(key)) {
        return {};
    }
    auto res = materializer_.EnsureDirectory(parent, session.destination.GetRoot(), &session.cancel);
    if (!res) {
        return std::unexpected(res.error());
    }
    session.created_dirs.insert(key);
    return {};
}

Storage::StorageResult<void> TransferOrchestrator::ExecuteItem(
    TransferSession &session, TransferOperation operation, const fs::path &source,
    const fs::path &destination, bool overwrite, const ItemContext &ctx, const EventSink &sink
)
{
    std::error_code ec;
    const auto source_status = fs::status(source, ec);
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    const bool is_directory = fs::is_directory(source_status);
    if (!is_directory && !fs::is_regular_file(source_status)) {
        return std::unexpected(Storage::make_error_code(StorageErrc::NotSupported));
    }
    // Overlapping roots: the destination may not be the source, lie above it, or
    // (for directories) lie inside it. Replacing such a destination would
    // delete the source before anything was copied.
    if (Storage::PathResolver::IsWithin(destination, source) ||
        (is_directory && Storage::PathResolver::IsWithin(source, destination))) {
        return std::unexpected(Storage::make_error_code(StorageErrc::InvalidPath));
    }

    std::uint64_t source_size = 0;
    if (!is_directory) {
        source_size = fs::file_size(source, ec);
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }
    }

    if (auto res = MaterializeParent(session, destination); !res) {
        return res;
    }

    const bool destination_exists = fs::exists(fs::symlink_status(destination, ec));
    if (destination_exists && !overwrite) {
        return std::unexpected(Storage::make_error_code(StorageErrc::AlreadyExists));
    }

    ProgressThrottle throttle(config_.transfer.progress_interval);
    throttle.Reset();
    const ByteProgressCallback forward = [&](std::uint64_t copied, std::uint64_t total_bytes) {
        if (auto sample = throttle.Update(copied, total_bytes)) {
            Emit(
                sink, FileProgressEvent{
                          Snapshot(session, ctx.current, ctx.total), ctx.display_name,
                          sample->bytes_copied, sample->bytes_total, sample->bytes_per_second
                      }
            );
        }
    };
    const auto &dest_root = session.destination.GetRoot();

    if (operation == TransferOperation::Move) {
        auto outcome = move_strategy_.Move(
            source, destination, dest_root, is_directory, overwrite, forward, &session.cancel
        );
        if (!outcome) {
            return std::unexpected(outcome.error());
        }
        if (outcome->renamed) {
            Emit(
                sink, FileProgressEvent{
                          Snapshot(session, ctx.current, ctx.total), ctx.display_name, source_size,
                          source_size, 0.0
                      }
            );
        } else {
            spdlog::info(
                "Moved {} by copy ({} bytes); rename failed: {}", source.string(),
                outcome->bytes_copied, outcome->rename_error.message()
            );
        }
        return {};
    }

    if (destination_exists) {
        fs::remove_all(destination, ec);
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }
    }

    if (is_directory) {
        auto copied = directory_copier_.CopyDirectory(
            source, destination, dest_root, forward, &session.cancel
        );
        if (!copied) {
            std::error_code cleanup_ec;
            fs::remove_all(destination, cleanup_ec);
            if (cleanup_ec) {
                spdlog::warn(
                    "Could not remove partial copy {}: {}", destination.string(), cleanup_ec.message()
                );
            }
            return std::unexpected(copied.error());
        }
        spdlog::debug("Copied tree {} -> {} ({} bytes)", source.string(), destination.string(), *copied);
        return {};
    }

    auto copied = file_copier_.CopyFile(source, destination, forward, &session.cancel);
    if (!copied) {
        return std::unexpected(copied.error());
    }
    spdlog::debug("Copied {} -> {} ({} bytes)", source.string(), destination.string(), *copied);
    return normalizer_.ApplyFileMode(destination);
}

}  // namespace MediaShuttle::Transfer

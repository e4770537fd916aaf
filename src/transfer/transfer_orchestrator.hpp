#ifndef MEDIASHUTTLE_SRC_TRANSFER_TRANSFER_ORCHESTRATOR_HPP_
#define MEDIASHUTTLE_SRC_TRANSFER_TRANSFER_ORCHESTRATOR_HPP_

#include "cancellation_token.hpp"
#include "config/config_types.hpp"
#include "storage/directory_materializer.hpp"
#include "storage/i_permission_normalizer.hpp"
#include "storage/storage_error.hpp"
#include "transfer/directory_copier.hpp"
#include "transfer/file_copier.hpp"
#include "transfer/move_strategy.hpp"
#include "transfer/transfer_types.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace MediaShuttle::Transfer
{

namespace fs = std::filesystem;

// Entry point of the transfer engine. Holds no per-request state, so one
// instance may serve concurrent requests; everything mutable lives in the
// TransferSession created by Run().
class TransferOrchestrator
{
    private:
    template <typename T>
    using StorageResult = Storage::StorageResult<T>;

    struct ItemContext {
        std::size_t current = 0;
        std::size_t total   = 0;
        std::string display_name;
    };

    public:
    TransferOrchestrator(
        const Config::ServiceConfig& config, Storage::IPermissionNormalizer& normalizer,
        MoveHooks hooks = {}
    );
    ~TransferOrchestrator() = default;

    TransferOrchestrator(const TransferOrchestrator&)            = delete;
    TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;
    TransferOrchestrator(TransferOrchestrator&&)                 = delete;
    TransferOrchestrator& operator=(TransferOrchestrator&&)      = delete;

    // Processes `request` item by item, in order, emitting the progress
    // protocol through `sink`. Ends with exactly one CompleteEvent, or with one
    // ErrorEvent when the request had to be aborted (roots unavailable,
    // cancellation, unexpected failure).
    TransferSummary Run(
        const TransferRequest& request, const EventSink& sink, const CancellationToken& cancel
    );

    private:
    void ProcessItem(
        TransferSession& session, const TransferRequest& request, std::size_t index,
        const EventSink& sink
    );

    StorageResult<void> ExecuteItem(
        TransferSession& session, TransferOperation operation, const fs::path& source,
        const fs::path& destination, bool overwrite, const ItemContext& ctx,
        const EventSink& sink
    );

    StorageResult<void> MaterializeParent(TransferSession& session, const fs::path& destination);

    static TransferCounters Snapshot(
        const TransferSession& session, std::size_t current, std::size_t total
    );

    const Config::ServiceConfig config_;
    Storage::IPermissionNormalizer& normalizer_;
    FileCopier file_copier_;
    Storage::DirectoryMaterializer materializer_;
    DirectoryCopier directory_copier_;
    MoveStrategy move_strategy_;
};

}  // namespace MediaShuttle::Transfer

#endif  // MEDIASHUTTLE_SRC_TRANSFER_TRANSFER_ORCHESTRATOR_HPP_

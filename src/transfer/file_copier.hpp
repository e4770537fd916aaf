#ifndef MEDIASHUTTLE_SRC_TRANSFER_FILE_COPIER_HPP_
#define MEDIASHUTTLE_SRC_TRANSFER_FILE_COPIER_HPP_

#include "app_constants.hpp"
#include "cancellation_token.hpp"
#include "storage/storage_error.hpp"
#include "transfer/transfer_types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace MediaShuttle::Transfer
{

namespace fs = std::filesystem;

// Streams one regular file into a new destination file chunk by chunk.
class FileCopier
{
    private:
    template <typename T>
    using StorageResult = Storage::StorageResult<T>;

    public:
    explicit FileCopier(std::size_t chunk_size = Constants::DEFAULT_COPY_CHUNK_SIZE);

    // Copies `src` to `dst` (created or truncated). `on_progress` receives the
    // cumulative byte count after every chunk; a zero-byte file reports (0, 0)
    // once. Success is returned only after the destination was fsync'ed and
    // closed. On failure or cancellation the partial destination is unlinked.
    StorageResult<std::uint64_t> CopyFile(
        const fs::path& src, const fs::path& dst, const ByteProgressCallback& on_progress,
        const CancellationToken* cancel = nullptr
    ) const;

    std::size_t GetChunkSize() const { return chunk_size_; }

    private:
    const std::size_t chunk_size_;
};

}  // namespace MediaShuttle::Transfer

#endif  // MEDIASHUTTLE_SRC_TRANSFER_FILE_COPIER_HPP_

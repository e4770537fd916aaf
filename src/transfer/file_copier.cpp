#include "transfer/file_copier.hpp"

#include "storage/file_descriptor_guard.hpp"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <vector>

namespace MediaShuttle::Transfer
{

using Storage::ErrnoError;
using Storage::FileDescriptorGuard;
using Storage::make_error_code;
using Storage::StorageErrc;

namespace
{

ssize_t ReadRetrying(int fd, std::byte* buffer, std::size_t size)
{
    ssize_t n;
    do {
        n = ::read(fd, buffer, size);
    } while (n == -1 && errno == EINTR);
    return n;
}

// Writes the whole buffer, looping over partial writes.
Storage::StorageResult<void> WriteAll(int fd, const std::byte* data, std::size_t size)
{
    std::size_t written = 0;
    while (written < size) {
        const ssize_t n = ::write(fd, data + written, size - written);
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(ErrnoError(errno));
        }
        if (n == 0) {
            return std::unexpected(make_error_code(StorageErrc::ShortWrite));
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

}  // namespace

FileCopier::FileCopier(std::size_t chunk_size) : chunk_size_(std::max<std::size_t>(chunk_size, 1)) {}

Storage::StorageResult<std::uint64_t> FileCopier::CopyFile(
    const fs::path& src, const fs::path& dst, const ByteProgressCallback& on_progress,
    const CancellationToken* cancel
) const
{
    FileDescriptorGuard src_fd(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!src_fd) {
        return std::unexpected(ErrnoError(errno));
    }

    struct stat src_stat{};
    if (::fstat(src_fd.get(), &src_stat) == -1) {
        return std::unexpected(ErrnoError(errno));
    }
    if (S_ISDIR(src_stat.st_mode)) {
        return std::unexpected(make_error_code(StorageErrc::IsADirectory));
    }
    if (!S_ISREG(src_stat.st_mode)) {
        return std::unexpected(make_error_code(StorageErrc::NotSupported));
    }
    std::uint64_t bytes_total = static_cast<std::uint64_t>(src_stat.st_size);

    FileDescriptorGuard dst_fd(
        ::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH)
    );
    if (!dst_fd) {
        return std::unexpected(ErrnoError(errno));
    }

    auto abort_copy = [&](std::error_code ec) -> Storage::StorageResult<std::uint64_t> {
        dst_fd.reset();
        if (::unlink(dst.c_str()) == -1 && errno != ENOENT) {
            spdlog::warn("Could not remove partial copy {}: errno {}", dst.string(), errno);
        }
        spdlog::debug("Copy {} -> {} aborted: {}", src.string(), dst.string(), ec.message());
        return std::unexpected(ec);
    };

    std::vector<std::byte> buffer(chunk_size_);
    std::uint64_t bytes_copied = 0;

    if (bytes_total == 0 && on_progress) {
        on_progress(0, 0);
    }

    while (true) {
        if (cancel && cancel->IsCancelled()) {
            return abort_copy(make_error_code(StorageErrc::Cancelled));
        }

        const ssize_t n = ReadRetrying(src_fd.get(), buffer.data(), buffer.size());
        if (n == -1) {
            return abort_copy(ErrnoError(errno));
        }
        if (n == 0) {
            break;
        }

        auto write_res = WriteAll(dst_fd.get(), buffer.data(), static_cast<std::size_t>(n));
        if (!write_res) {
            return abort_copy(write_res.error());
        }

        bytes_copied += static_cast<std::uint64_t>(n);
        // The size snapshot is best effort; a growing source extends the total
        bytes_total = std::max(bytes_total, bytes_copied);
        if (on_progress) {
            on_progress(bytes_copied, bytes_total);
        }
        spdlog::trace("Copied {}/{} bytes of {}", bytes_copied, bytes_total, src.string());
    }

    if (bytes_copied != bytes_total) {
        // Source shrank while it was being read
        if (on_progress) {
            on_progress(bytes_copied, bytes_copied);
        }
    }

    // EINVAL: the destination filesystem does not support syncing
    if (::fsync(dst_fd.get()) == -1 && errno != EINVAL) {
        return abort_copy(ErrnoError(errno));
    }
    if (const int close_errno = dst_fd.Close(); close_errno != 0) {
        return abort_copy(ErrnoError(close_errno));
    }

    return bytes_copied;
}

}  // namespace MediaShuttle::Transfer

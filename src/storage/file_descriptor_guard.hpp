#ifndef MEDIASHUTTLE_SRC_STORAGE_FILE_DESCRIPTOR_GUARD_HPP_
#define MEDIASHUTTLE_SRC_STORAGE_FILE_DESCRIPTOR_GUARD_HPP_

#include <unistd.h>
#include <cerrno>
#include <utility>

namespace MediaShuttle::Storage
{

// Owns a POSIX file descriptor. Close() reports the close(2) result for
// descriptors whose close failure matters (written files); the destructor
// closes silently.
class FileDescriptorGuard
{
    private:
    int fd_;

    public:
    explicit FileDescriptorGuard(int fd = -1) noexcept : fd_(fd) {}
    ~FileDescriptorGuard() { reset(); }
    FileDescriptorGuard(const FileDescriptorGuard&)            = delete;
    FileDescriptorGuard& operator=(const FileDescriptorGuard&) = delete;
    FileDescriptorGuard(FileDescriptorGuard&& other) noexcept : fd_(other.release()) {}
    FileDescriptorGuard& operator=(FileDescriptorGuard&& other) noexcept
    {
        reset(other.release());
        return *this;
    }
    int get() const noexcept { return fd_; }
    int release() noexcept { return std::exchange(fd_, -1); }
    void reset(int new_fd = -1) noexcept
    {
        if (fd_ >= 0 && fd_ != new_fd) {
            ::close(fd_);
        }
        fd_ = new_fd;
    }

    // Returns 0 on success or the errno of the failed close.
    int Close() noexcept
    {
        if (fd_ < 0) {
            return 0;
        }
        const int fd = release();
        return ::close(fd) == -1 ? errno : 0;
    }
    explicit operator bool() const noexcept { return fd_ >= 0; }
};

}  // namespace MediaShuttle::Storage

#endif  // MEDIASHUTTLE_SRC_STORAGE_FILE_DESCRIPTOR_GUARD_HPP_

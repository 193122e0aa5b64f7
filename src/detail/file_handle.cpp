#include "rangedl/detail/file_handle.hpp"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace rangedl::detail {

namespace {

[[noreturn]] void throwErrno(const std::string& what, const std::string& path) {
    throw std::system_error(errno, std::generic_category(), what + " " + path);
}

} // namespace

FileHandle::~FileHandle() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

FileHandle::FileHandle(FileHandle&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

FileHandle FileHandle::open(const std::string& path, int flags, unsigned int mode) {
    const int fd = ::open(path.c_str(), flags | O_CLOEXEC, static_cast<mode_t>(mode));
    if (fd < 0) {
        throwErrno("open", path);
    }
    return FileHandle(fd, path);
}

void FileHandle::writeAt(const void* data, std::size_t size, std::uint64_t offset) {
    const auto* bytes = static_cast<const char*>(data);
    while (size > 0) {
        const ssize_t n = ::pwrite(fd_, bytes, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throwErrno("pwrite", path_);
        }
        bytes += n;
        size -= static_cast<std::size_t>(n);
        offset += static_cast<std::uint64_t>(n);
    }
}

void FileHandle::readAt(void* data, std::size_t size, std::uint64_t offset) const {
    auto* bytes = static_cast<char*>(data);
    while (size > 0) {
        const ssize_t n = ::pread(fd_, bytes, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throwErrno("pread", path_);
        }
        if (n == 0) {
            throw std::system_error(std::make_error_code(std::errc::io_error), "short read " + path_);
        }
        bytes += n;
        size -= static_cast<std::size_t>(n);
        offset += static_cast<std::uint64_t>(n);
    }
}

void FileHandle::truncate(std::uint64_t size) {
    if (::ftruncate(fd_, static_cast<off_t>(size)) == -1) {
        throwErrno("ftruncate", path_);
    }
}

void FileHandle::sync() {
    if (::fsync(fd_) == -1) {
        throwErrno("fsync", path_);
    }
}

void FileHandle::close() {
    if (fd_ < 0) {
        return;
    }
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) == -1) {
        throwErrno("close", path_);
    }
}

std::uint64_t FileHandle::size() const {
    struct stat st{};
    if (::fstat(fd_, &st) == -1) {
        throwErrno("fstat", path_);
    }
    return static_cast<std::uint64_t>(st.st_size);
}

} // namespace rangedl::detail

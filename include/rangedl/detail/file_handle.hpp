#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace rangedl::detail {

// Owning POSIX descriptor with positional I/O. Errors throw std::system_error.
class FileHandle {
public:
    FileHandle() = default;
    ~FileHandle();

    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;
    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    static FileHandle open(const std::string& path, int flags, unsigned int mode = 0644);

    // pwrite until every byte is written; safe to call concurrently on disjoint spans.
    void writeAt(const void* data, std::size_t size, std::uint64_t offset);
    // pread exactly size bytes; a short file is an error.
    void readAt(void* data, std::size_t size, std::uint64_t offset) const;

    void truncate(std::uint64_t size);
    void sync();
    void close();

    [[nodiscard]] std::uint64_t size() const;
    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    FileHandle(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

    int fd_{-1};
    std::string path_;
};

} // namespace rangedl::detail

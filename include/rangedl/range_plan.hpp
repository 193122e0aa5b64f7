#pragma once

#include "progress_bitmap.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace rangedl {

struct RangeAssignment {
    std::uint64_t offset{0};
    std::uint64_t length{0};

    [[nodiscard]] std::uint64_t end() const noexcept { return offset + length; }
    [[nodiscard]] bool empty() const noexcept { return length == 0; }

    bool operator==(const RangeAssignment& other) const noexcept {
        return offset == other.offset && length == other.length;
    }
};

// Maps byte positions of a file onto fixed-size chunks. The last chunk may be short.
class ChunkGeometry {
public:
    ChunkGeometry(std::uint64_t file_size, std::uint64_t chunk_size);

    [[nodiscard]] std::uint64_t fileSize() const noexcept { return file_size_; }
    [[nodiscard]] std::uint64_t chunkSize() const noexcept { return chunk_size_; }
    [[nodiscard]] std::uint64_t chunkCount() const noexcept;
    [[nodiscard]] std::uint64_t bitmapBytes() const noexcept;

    [[nodiscard]] std::uint64_t chunkOf(std::uint64_t byte) const noexcept { return byte / chunk_size_; }
    [[nodiscard]] std::uint64_t chunkBegin(std::uint64_t chunk) const noexcept;
    [[nodiscard]] std::uint64_t chunkEnd(std::uint64_t chunk) const noexcept;
    [[nodiscard]] std::uint64_t chunkLength(std::uint64_t chunk) const noexcept;

private:
    std::uint64_t file_size_;
    std::uint64_t chunk_size_;
};

// Splits [0, size) into worker_count contiguous ranges of size / worker_count
// bytes; the last range also takes the size % worker_count remainder.
std::vector<RangeAssignment> splitRanges(std::uint64_t size, int worker_count);

// Shrinks an assignment so it starts at its first incomplete chunk. The scan
// covers every chunk the assignment touches, including partially owned ones.
// Returns nullopt when there is nothing left to fetch.
std::optional<RangeAssignment> resumeRange(const RangeAssignment& range,
                                           const ProgressBitmap& bitmap,
                                           const ChunkGeometry& geometry);

} // namespace rangedl

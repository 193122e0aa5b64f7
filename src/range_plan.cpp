#include "rangedl/range_plan.hpp"

#include <algorithm>
#include <stdexcept>

namespace rangedl {

ChunkGeometry::ChunkGeometry(std::uint64_t file_size, std::uint64_t chunk_size)
    : file_size_(file_size), chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
}

std::uint64_t ChunkGeometry::chunkCount() const noexcept {
    return (file_size_ + chunk_size_ - 1) / chunk_size_;
}

std::uint64_t ChunkGeometry::bitmapBytes() const noexcept {
    return ProgressBitmap::byteLengthFor(chunkCount());
}

std::uint64_t ChunkGeometry::chunkBegin(std::uint64_t chunk) const noexcept {
    return std::min(chunk * chunk_size_, file_size_);
}

std::uint64_t ChunkGeometry::chunkEnd(std::uint64_t chunk) const noexcept {
    return std::min((chunk + 1) * chunk_size_, file_size_);
}

std::uint64_t ChunkGeometry::chunkLength(std::uint64_t chunk) const noexcept {
    return chunkEnd(chunk) - chunkBegin(chunk);
}

std::vector<RangeAssignment> splitRanges(std::uint64_t size, int worker_count) {
    if (worker_count <= 0) {
        throw std::invalid_argument("Worker count must be positive");
    }

    const auto workers = static_cast<std::uint64_t>(worker_count);
    const std::uint64_t range_size = size / workers;
    const std::uint64_t excess = size % workers;

    std::vector<RangeAssignment> ranges;
    ranges.reserve(workers);
    std::uint64_t offset = 0;
    for (std::uint64_t i = 0; i < workers; ++i) {
        RangeAssignment range{offset, range_size};
        if (i == workers - 1) {
            range.length += excess;
        }
        ranges.push_back(range);
        offset += range.length;
    }
    return ranges;
}

std::optional<RangeAssignment> resumeRange(const RangeAssignment& range,
                                           const ProgressBitmap& bitmap,
                                           const ChunkGeometry& geometry) {
    if (range.empty()) {
        return std::nullopt;
    }

    const std::uint64_t low = geometry.chunkOf(range.offset);
    const std::uint64_t high = (range.end() + geometry.chunkSize() - 1) / geometry.chunkSize();
    const auto zero = bitmap.firstZero(low, high);
    if (!zero) {
        return std::nullopt;
    }

    // A chunk shared with the previous range starts before our offset; its
    // head belongs to the other worker.
    const std::uint64_t start = std::max(range.offset, geometry.chunkBegin(*zero));
    return RangeAssignment{start, range.end() - start};
}

} // namespace rangedl

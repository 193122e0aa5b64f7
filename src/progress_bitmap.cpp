#include "rangedl/progress_bitmap.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace rangedl {

namespace {

constexpr std::uint8_t maskFor(std::uint64_t index) noexcept {
    return static_cast<std::uint8_t>(0x80u >> (index % 8));
}

} // namespace

ProgressBitmap::ProgressBitmap(std::uint64_t bit_count)
    : bit_count_(bit_count), bytes_(byteLengthFor(bit_count), 0) {}

ProgressBitmap ProgressBitmap::fromBytes(std::uint64_t bit_count, std::vector<std::uint8_t> bytes) {
    if (bytes.size() != byteLengthFor(bit_count)) {
        throw std::invalid_argument("Bitmap of " + std::to_string(bit_count) + " bits needs "
            + std::to_string(byteLengthFor(bit_count)) + " bytes, got " + std::to_string(bytes.size()));
    }
    ProgressBitmap bitmap;
    bitmap.bit_count_ = bit_count;
    bitmap.bytes_ = std::move(bytes);
    return bitmap;
}

void ProgressBitmap::set(std::uint64_t index) {
    checkIndex(index);
    bytes_[index / 8] |= maskFor(index);
}

bool ProgressBitmap::test(std::uint64_t index) const {
    checkIndex(index);
    return (bytes_[index / 8] & maskFor(index)) != 0;
}

std::optional<std::uint64_t> ProgressBitmap::firstZero(std::uint64_t low, std::uint64_t high) const {
    high = std::min(high, bit_count_);
    for (std::uint64_t pos = low; pos < high; ++pos) {
        // Skip whole bytes that are fully set.
        if (pos % 8 == 0 && pos + 8 <= high && bytes_[pos / 8] == 0xFF) {
            pos += 7;
            continue;
        }
        if ((bytes_[pos / 8] & maskFor(pos)) == 0) {
            return pos;
        }
    }
    return std::nullopt;
}

std::uint64_t ProgressBitmap::countSet() const {
    std::uint64_t count = 0;
    for (std::uint64_t i = 0; i < bit_count_; ++i) {
        if ((bytes_[i / 8] & maskFor(i)) != 0) {
            ++count;
        }
    }
    return count;
}

void ProgressBitmap::checkIndex(std::uint64_t index) const {
    if (index >= bit_count_) {
        throw std::out_of_range("Chunk index " + std::to_string(index) + " out of range ("
            + std::to_string(bit_count_) + " chunks)");
    }
}

} // namespace rangedl

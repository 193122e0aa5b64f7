#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace rangedl {

// One bit per chunk, most significant bit first within each byte.
// Not synchronized; the owning job serializes mutation and persistence.
class ProgressBitmap {
public:
    ProgressBitmap() = default;
    explicit ProgressBitmap(std::uint64_t bit_count);

    // Rebuilds a bitmap from its persisted bytes. Throws std::invalid_argument
    // when the byte count does not match byteLengthFor(bit_count).
    static ProgressBitmap fromBytes(std::uint64_t bit_count, std::vector<std::uint8_t> bytes);

    static constexpr std::uint64_t byteLengthFor(std::uint64_t bit_count) noexcept {
        return (bit_count + 7) / 8;
    }

    void set(std::uint64_t index);
    [[nodiscard]] bool test(std::uint64_t index) const;

    // Smallest unset index in [low, high), or nullopt when the whole range is set.
    [[nodiscard]] std::optional<std::uint64_t> firstZero(std::uint64_t low, std::uint64_t high) const;

    [[nodiscard]] std::uint64_t countSet() const;
    [[nodiscard]] std::uint64_t bitCount() const noexcept { return bit_count_; }
    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const noexcept { return bytes_; }

private:
    void checkIndex(std::uint64_t index) const;

    std::uint64_t bit_count_{0};
    std::vector<std::uint8_t> bytes_;
};

} // namespace rangedl

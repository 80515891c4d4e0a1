#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

// Packed per-file bit sequence. Bit i lives in byte i/8, most significant
// bit first, so the packed storage is already the on-disk layout. Bits past
// size() in the last byte are always zero.
class BitMask {
public:
    BitMask() = default;
    explicit BitMask(std::size_t count);

    // Unpacks the first `count` bits of `bytes`; padding bits are dropped.
    static BitMask fromBytes(const std::vector<std::uint8_t>& bytes, std::size_t count);

    std::size_t size() const { return bitCount; }
    bool empty() const { return bitCount == 0; }

    // Out-of-range reads return false
    bool get(std::size_t index) const;
    bool operator[](std::size_t index) const { return get(index); }

    // Out-of-range writes and removals are ignored
    void set(std::size_t index, bool value);
    void removeAt(std::size_t index);
    void pushBack(bool value);

    std::size_t count() const;

    const std::vector<std::uint8_t>& toBytes() const { return bytes; }

    static std::size_t byteCount(std::size_t bits) { return (bits + 7) / 8; }

    bool operator==(const BitMask& other) const {
        return bitCount == other.bitCount && bytes == other.bytes;
    }
    bool operator!=(const BitMask& other) const { return !(*this == other); }

private:
    static std::uint8_t bitFor(std::size_t index) {
        return static_cast<std::uint8_t>(0x80u >> (index % 8));
    }

    std::vector<std::uint8_t> bytes;
    std::size_t bitCount = 0;
};

#include "BitMask.hpp"
#include <algorithm>

BitMask::BitMask(std::size_t count)
    : bytes(byteCount(count), 0), bitCount(count)
{
}

BitMask BitMask::fromBytes(const std::vector<std::uint8_t>& src, std::size_t count) {
    BitMask mask(count);
    std::size_t n = std::min(src.size(), mask.bytes.size());
    for (std::size_t i = 0; i < n; ++i)
        mask.bytes[i] = src[i];

    // clear padding so equal masks compare equal and re-encode identically
    if (count % 8 != 0 && !mask.bytes.empty())
        mask.bytes.back() &= static_cast<std::uint8_t>(0xFFu << (8 - count % 8));

    return mask;
}

bool BitMask::get(std::size_t index) const {
    if (index >= bitCount) return false;
    return (bytes[index / 8] & bitFor(index)) != 0;
}

void BitMask::set(std::size_t index, bool value) {
    if (index >= bitCount) return;
    if (value)
        bytes[index / 8] |= bitFor(index);
    else
        bytes[index / 8] &= static_cast<std::uint8_t>(~bitFor(index));
}

void BitMask::removeAt(std::size_t index) {
    if (index >= bitCount) return;

    for (std::size_t i = index; i + 1 < bitCount; ++i)
        set(i, get(i + 1));

    set(bitCount - 1, false);
    --bitCount;
    bytes.resize(byteCount(bitCount));
}

void BitMask::pushBack(bool value) {
    ++bitCount;
    if (bytes.size() < byteCount(bitCount))
        bytes.push_back(0);
    set(bitCount - 1, value);
}

std::size_t BitMask::count() const {
    std::size_t total = 0;
    for (std::uint8_t b : bytes) {
        while (b) {
            b &= static_cast<std::uint8_t>(b - 1);
            ++total;
        }
    }
    return total;
}

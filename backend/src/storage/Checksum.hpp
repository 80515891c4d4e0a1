#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// 16-byte fingerprint of serialized section bytes (BLAKE2b via libsodium).
struct Checksum {
    static constexpr std::size_t SIZE = 16;

    std::array<std::uint8_t, SIZE> bytes{};

    static Checksum compute(const std::uint8_t* data, std::size_t len);
    static Checksum compute(const std::vector<std::uint8_t>& data);

    std::string toHex() const;

    bool operator==(const Checksum& other) const { return bytes == other.bytes; }
    bool operator!=(const Checksum& other) const { return bytes != other.bytes; }
};

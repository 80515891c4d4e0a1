#pragma once
#include <cstdint>
#include <string>
#include "BitMask.hpp"

class ByteReader;
class ByteWriter;

// Tag category codes
namespace TagType {
    constexpr std::uint16_t Platform = 1;
    constexpr std::uint16_t Architecture = 2;
    constexpr std::uint16_t Locale = 3;
    constexpr std::uint16_t Region = 4;
    constexpr std::uint16_t Feature = 5;
    constexpr std::uint16_t Alternate = 0x4000;
}

class TagEntry {
public:
    TagEntry() = default;
    TagEntry(const std::string& name, std::uint16_t typeId, std::size_t fileCount = 0);

    std::string name;
    std::uint16_t typeId = 0;
    BitMask fileMask;

    // Layout: name '\0', u16 BE type id, ceil(fileCount / 8) mask bytes.
    // Throws FormatError if the reader runs out of bytes.
    void read(ByteReader& reader, std::uint32_t fileCount);
    void write(ByteWriter& writer) const;

    bool operator==(const TagEntry& other) const {
        return name == other.name && typeId == other.typeId && fileMask == other.fileMask;
    }
    bool operator!=(const TagEntry& other) const { return !(*this == other); }
};

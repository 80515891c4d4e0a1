#include "TagEntry.hpp"
#include "../storage/ByteStream.hpp"
#include <spdlog/spdlog.h>

TagEntry::TagEntry(const std::string& n, std::uint16_t type, std::size_t fileCount)
    : name(n), typeId(type), fileMask(fileCount)
{
}

void TagEntry::read(ByteReader& reader, std::uint32_t fileCount) {
    name = reader.readCString();
    typeId = reader.readU16BE();
    fileMask = BitMask::fromBytes(reader.readBytes(BitMask::byteCount(fileCount)), fileCount);

    spdlog::debug("Read tag '{}' type={} set={}/{}", name, typeId, fileMask.count(), fileCount);
}

void TagEntry::write(ByteWriter& writer) const {
    writer.writeCString(name);
    writer.writeU16BE(typeId);
    writer.writeBytes(fileMask.toBytes());
}

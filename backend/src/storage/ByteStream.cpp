#include "ByteStream.hpp"
#include "../utils/Errors.hpp"
#include <algorithm>

void ByteWriter::writeU8(std::uint8_t value) {
    buffer.push_back(value);
}

void ByteWriter::writeU16BE(std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>(value >> 8));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

void ByteWriter::writeU32BE(std::uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8)
        buffer.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
}

void ByteWriter::writeCString(const std::string& value) {
    buffer.insert(buffer.end(), value.begin(), value.end());
    buffer.push_back(0);
}

void ByteWriter::writeBytes(const std::vector<std::uint8_t>& bytes) {
    buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

ByteReader::ByteReader(const std::vector<std::uint8_t>& bytes, std::size_t offset)
    : buffer(bytes), pos(std::min(offset, bytes.size()))
{
}

void ByteReader::require(std::size_t count, const char* what) const {
    if (remaining() < count) {
        throw FormatError(std::string("Unexpected end of stream reading ") + what +
            ": need " + std::to_string(count) + " byte(s), have " + std::to_string(remaining()));
    }
}

std::uint8_t ByteReader::readU8() {
    require(1, "u8");
    return buffer[pos++];
}

std::uint16_t ByteReader::readU16BE() {
    require(2, "u16");
    std::uint16_t value = static_cast<std::uint16_t>((buffer[pos] << 8) | buffer[pos + 1]);
    pos += 2;
    return value;
}

std::uint32_t ByteReader::readU32BE() {
    require(4, "u32");
    std::uint32_t value = 0;
    for (int i = 0; i < 4; ++i)
        value = (value << 8) | buffer[pos + i];
    pos += 4;
    return value;
}

std::string ByteReader::readCString() {
    auto begin = buffer.begin() + static_cast<std::ptrdiff_t>(pos);
    auto terminator = std::find(begin, buffer.end(), std::uint8_t{0});
    if (terminator == buffer.end())
        throw FormatError("Unterminated string at offset " + std::to_string(pos));

    std::string value(begin, terminator);
    pos += value.size() + 1;
    return value;
}

std::vector<std::uint8_t> ByteReader::readBytes(std::size_t count) {
    require(count, "byte run");
    auto begin = buffer.begin() + static_cast<std::ptrdiff_t>(pos);
    std::vector<std::uint8_t> out(begin, begin + static_cast<std::ptrdiff_t>(count));
    pos += count;
    return out;
}

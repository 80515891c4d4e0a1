#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

// Byte-level primitives for tag sections.
//
// All multi-byte integers are big-endian. Strings are stored as raw bytes
// followed by a single '\0'. The reader never reads past the end of its
// buffer: any request that cannot be satisfied throws FormatError.

class ByteWriter {
public:
    void writeU8(std::uint8_t value);
    void writeU16BE(std::uint16_t value);
    void writeU32BE(std::uint32_t value);
    void writeCString(const std::string& value);
    void writeBytes(const std::vector<std::uint8_t>& bytes);

    std::size_t size() const { return buffer.size(); }
    const std::vector<std::uint8_t>& data() const { return buffer; }

private:
    std::vector<std::uint8_t> buffer;
};

class ByteReader {
public:
    explicit ByteReader(const std::vector<std::uint8_t>& bytes, std::size_t offset = 0);

    std::uint8_t readU8();
    std::uint16_t readU16BE();
    std::uint32_t readU32BE();
    std::string readCString();
    std::vector<std::uint8_t> readBytes(std::size_t count);

    std::size_t position() const { return pos; }
    std::size_t remaining() const { return buffer.size() - pos; }

private:
    void require(std::size_t count, const char* what) const;

    const std::vector<std::uint8_t>& buffer;
    std::size_t pos;
};

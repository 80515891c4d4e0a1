#include "Storage.hpp"
#include "ByteStream.hpp"
#include "Checksum.hpp"
#include "../utils/Errors.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "TAGSEC1\n";
static constexpr std::size_t MAGIC_LEN = sizeof(MAGIC_HDR) - 1;

bool Storage::saveTagSection(TagCollection& tags, std::uint32_t fileCount, const std::string& filename) {
    spdlog::info("Saving {} tags over {} files to '{}'", tags.size(), fileCount, filename);

    ByteWriter writer;
    for (std::size_t i = 0; i < MAGIC_LEN; ++i)
        writer.writeU8(static_cast<std::uint8_t>(MAGIC_HDR[i]));
    writer.writeU32BE(static_cast<std::uint32_t>(tags.size()));
    writer.writeU32BE(fileCount);

    try {
        tags.write(writer);
    }
    catch (const std::runtime_error& e) {
        spdlog::error("Encoding tag section failed: {}", e.what());
        return false;
    }

    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for writing tag section", filename);
        return false;
    }

    const auto& checksum = *tags.checksum();
    out.write(reinterpret_cast<const char*>(writer.data().data()),
        static_cast<std::streamsize>(writer.size()));
    out.write(reinterpret_cast<const char*>(checksum.bytes.data()),
        static_cast<std::streamsize>(checksum.bytes.size()));

    if (!out) {
        spdlog::error("Write to '{}' failed", filename);
        return false;
    }
    return true;
}

bool Storage::loadTagSection(TagCollection& tags, std::uint32_t& fileCount, const std::string& filename) {
    spdlog::info("Loading tag section from '{}'", filename);
    tags.clear();
    fileCount = 0;

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Tag section file '{}' not found", filename);
        return false;
    }

    std::vector<std::uint8_t> bytes(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (bytes.size() < MAGIC_LEN + 8 + Checksum::SIZE ||
        std::memcmp(bytes.data(), MAGIC_HDR, MAGIC_LEN) != 0)
    {
        spdlog::error("Invalid magic header");
        return false;
    }

    // Split off the trailer so the reader cannot run into it
    std::vector<std::uint8_t> body(bytes.begin(), bytes.end() - Checksum::SIZE);
    Checksum stored;
    std::copy(bytes.end() - Checksum::SIZE, bytes.end(), stored.bytes.begin());

    try {
        std::size_t sectionStart = MAGIC_LEN + 8;
        Checksum actual = Checksum::compute(body.data() + sectionStart, body.size() - sectionStart);
        if (actual != stored) {
            spdlog::error("Checksum mismatch: stored {}, computed {}", stored.toHex(), actual.toHex());
            return false;
        }

        ByteReader reader(body, MAGIC_LEN);
        std::uint32_t tagCount = reader.readU32BE();
        std::uint32_t count = reader.readU32BE();
        tags.read(reader, tagCount, count);

        if (reader.remaining() != 0) {
            spdlog::error("{} trailing byte(s) after tag section", reader.remaining());
            tags.clear();
            return false;
        }
        fileCount = count;
    }
    catch (const FormatError& e) {
        spdlog::error("Malformed tag section in '{}': {}", filename, e.what());
        tags.clear();
        return false;
    }
    catch (const std::runtime_error& e) {
        spdlog::error("Checksum of '{}' failed: {}", filename, e.what());
        return false;
    }

    spdlog::info("Loaded {} tags over {} files", tags.size(), fileCount);
    return true;
}

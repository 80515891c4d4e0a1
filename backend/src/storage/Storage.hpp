#pragma once
#include <cstdint>
#include <string>
#include "../core/TagCollection.hpp"

// Storage handles standalone tag section files.
//
// Layout (integers big-endian):
//   Header: 8 bytes ASCII "TAGSEC1\n" (magic + version)
//   tag_count: u32, file_count: u32
//   Section: tag entries as written by TagCollection::write
//   Trailer: Checksum::SIZE bytes, checksum of the section bytes
//
// Both calls return false (and log why) instead of throwing.

class Storage {
public:
    static bool saveTagSection(TagCollection& tags, std::uint32_t fileCount, const std::string& filename);
    static bool loadTagSection(TagCollection& tags, std::uint32_t& fileCount, const std::string& filename);
};

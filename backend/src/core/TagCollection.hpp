#pragma once
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "TagEntry.hpp"
#include "../storage/Checksum.hpp"

class ByteReader;
class ByteWriter;

// ASCII case folding for tag names ("enUS" == "ENUS")
struct TagNameHash {
    std::size_t operator()(const std::string& name) const;
};

struct TagNameEqual {
    bool operator()(const std::string& a, const std::string& b) const;
};

using TagMap = std::unordered_map<std::string, TagEntry, TagNameHash, TagNameEqual>;

// Lazy sequence of the names of every tag whose mask has `index` set.
// Walks the live map on each pass, so it can be iterated more than once;
// it must not outlive, or be iterated across mutations of, its collection.
class FileTagView {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator(TagMap::const_iterator first, TagMap::const_iterator last, std::size_t fileIndex)
            : pos(first), end(last), index(fileIndex) { skip(); }

        reference operator*() const { return pos->second.name; }
        pointer operator->() const { return &pos->second.name; }

        iterator& operator++() {
            ++pos;
            skip();
            return *this;
        }

        iterator operator++(int) {
            auto tmp = *this;
            ++(*this);
            return tmp;
        }

        bool operator==(const iterator& other) const { return pos == other.pos; }
        bool operator!=(const iterator& other) const { return pos != other.pos; }

    private:
        void skip() {
            while (pos != end && !pos->second.fileMask[index])
                ++pos;
        }

        TagMap::const_iterator pos;
        TagMap::const_iterator end;
        std::size_t index;
    };

    FileTagView() = default;
    FileTagView(const TagMap* map, std::size_t fileIndex) : entries(map), index(fileIndex) {}

    iterator begin() const;
    iterator end() const;
    bool empty() const { return begin() == end(); }

private:
    const TagMap* entries = nullptr;
    std::size_t index = 0;
};

// Tag name -> TagEntry mapping for one archive manifest. Every mask is kept
// at the owner's file count; the owner drives growth and shrinkage through
// appendFile() and removeFileIndex().
class TagCollection {
public:
    TagCollection() = default;

    // Section codec. read() replaces the current contents and throws
    // FormatError on truncated input or duplicate names; write() emits
    // entries in sortedTags() order and records the checksum of its bytes.
    void read(ByteReader& reader, std::uint32_t tagCount, std::uint32_t fileCount);
    void write(ByteWriter& writer);

    // Adds an all-clear tag. An existing tag of the same name is replaced.
    void add(const std::string& name, std::uint16_t typeId, std::size_t fileCount);

    // New names get a fresh mask of `fileCount` clear bits. Existing names are
    // replaced wholesale, mask included: callers wanting to keep the old bits
    // must copy them into `entry` first.
    void addOrUpdate(TagEntry entry, std::size_t fileCount);

    void remove(const TagEntry& entry) { remove(entry.name); }
    void remove(const std::string& name);
    void clear();

    TagEntry* tryGet(const std::string& name);
    const TagEntry* tryGet(const std::string& name) const;
    bool containsTag(const std::string& name) const;

    FileTagView tagsForFile(int index) const;

    // Sets or clears file `index` on the named tags, or on every tag when no
    // names are given. Unknown names are skipped; a negative index is a no-op.
    void setTags(int index, bool value, const std::vector<std::string>& tags = {});

    // Must be called in lockstep with the owner's file list
    void removeFileIndex(int index);
    // Returns the new file's index, or -1 when there are no tags to grow
    int appendFile();

    // Clears all tags and installs defaultTags(build, fileCount)
    void loadDefaultTags(std::uint32_t build, std::size_t fileCount);

    std::vector<const TagEntry*> sortedTags() const;

    const TagMap& tags() const { return entries; }
    std::size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

    // Fingerprint of the last write(); reset by any mutation through this API
    const std::optional<Checksum>& checksum() const { return lastChecksum; }

private:
    TagMap entries;
    std::optional<Checksum> lastChecksum;
};

// Serialization order: type id, then name. Alternate ranks directly after
// every Locale tag and before Region.
bool tagSortLess(const TagEntry& a, const TagEntry& b);

#include "TagCollection.hpp"
#include "DefaultTags.hpp"
#include "../storage/ByteStream.hpp"
#include "../utils/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <utility>
#include <spdlog/spdlog.h>

static char foldCase(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::size_t TagNameHash::operator()(const std::string& name) const {
    // FNV-1a over the lowercased bytes
    std::size_t h = 14695981039346656037ull;
    for (char c : name) {
        h ^= static_cast<unsigned char>(foldCase(c));
        h *= 1099511628211ull;
    }
    return h;
}

bool TagNameEqual::operator()(const std::string& a, const std::string& b) const {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i)
        if (foldCase(a[i]) != foldCase(b[i])) return false;
    return true;
}

// Backs every default-constructed view so begin() and end() share a container
static const TagMap noTags;

FileTagView::iterator FileTagView::begin() const {
    const TagMap& map = entries ? *entries : noTags;
    return iterator(map.begin(), map.end(), index);
}

FileTagView::iterator FileTagView::end() const {
    const TagMap& map = entries ? *entries : noTags;
    return iterator(map.end(), map.end(), index);
}

// Alternate is a locale variant, so it is ranked with the locales
static std::pair<std::uint32_t, int> sortRank(std::uint16_t typeId) {
    if (typeId == TagType::Alternate)
        return { TagType::Locale, 1 };
    return { typeId, 0 };
}

bool tagSortLess(const TagEntry& a, const TagEntry& b) {
    auto ra = sortRank(a.typeId);
    auto rb = sortRank(b.typeId);
    if (ra != rb) return ra < rb;
    return a.name < b.name;
}

void TagCollection::read(ByteReader& reader, std::uint32_t tagCount, std::uint32_t fileCount) {
    spdlog::debug("Reading {} tag(s) over {} file(s)", tagCount, fileCount);
    entries.clear();
    lastChecksum.reset();
    // Each entry takes at least 3 bytes ('\0' + u16), so the stream bounds the count
    entries.reserve(std::min<std::size_t>(tagCount, reader.remaining() / 3));

    for (std::uint32_t i = 0; i < tagCount; ++i) {
        TagEntry entry;
        entry.read(reader, fileCount);

        std::string key = entry.name;
        if (!entries.emplace(std::move(key), std::move(entry)).second)
            throw FormatError("Duplicate tag name in section at tag " + std::to_string(i));
    }

    spdlog::info("Loaded {} tags", entries.size());
}

void TagCollection::write(ByteWriter& writer) {
    std::size_t start = writer.size();

    for (const TagEntry* entry : sortedTags())
        entry->write(writer);

    lastChecksum = Checksum::compute(writer.data().data() + start, writer.size() - start);
    spdlog::info("Wrote {} tags ({} bytes, checksum {})",
        entries.size(), writer.size() - start, lastChecksum->toHex());
}

void TagCollection::add(const std::string& name, std::uint16_t typeId, std::size_t fileCount) {
    addOrUpdate(TagEntry(name, typeId, fileCount), fileCount);
}

void TagCollection::addOrUpdate(TagEntry entry, std::size_t fileCount) {
    lastChecksum.reset();

    auto it = entries.find(entry.name);
    if (it == entries.end()) {
        entry.fileMask = BitMask(fileCount);
        spdlog::debug("Tag '{}' added (type={})", entry.name, entry.typeId);
        std::string key = entry.name;
        entries.emplace(std::move(key), std::move(entry));
        return;
    }

    if (entry.fileMask.size() != fileCount) {
        spdlog::warn("Tag '{}' replaced with a {}-bit mask, expected {}",
            entry.name, entry.fileMask.size(), fileCount);
    }

    // The stored key keeps its original spelling, so replace key and value together
    entries.erase(it);
    spdlog::debug("Tag '{}' replaced (type={})", entry.name, entry.typeId);
    std::string key = entry.name;
    entries.emplace(std::move(key), std::move(entry));
}

void TagCollection::remove(const std::string& name) {
    if (entries.erase(name) > 0) {
        lastChecksum.reset();
        spdlog::debug("Tag '{}' removed", name);
    }
}

void TagCollection::clear() {
    entries.clear();
    lastChecksum.reset();
}

TagEntry* TagCollection::tryGet(const std::string& name) {
    auto it = entries.find(name);
    return it == entries.end() ? nullptr : &it->second;
}

const TagEntry* TagCollection::tryGet(const std::string& name) const {
    auto it = entries.find(name);
    return it == entries.end() ? nullptr : &it->second;
}

bool TagCollection::containsTag(const std::string& name) const {
    return entries.find(name) != entries.end();
}

FileTagView TagCollection::tagsForFile(int index) const {
    if (index < 0) return FileTagView();
    return FileTagView(&entries, static_cast<std::size_t>(index));
}

void TagCollection::setTags(int index, bool value, const std::vector<std::string>& tags) {
    if (index < 0) return;
    lastChecksum.reset();

    auto pos = static_cast<std::size_t>(index);
    if (tags.empty()) {
        for (auto& p : entries)
            p.second.fileMask.set(pos, value);
        spdlog::debug("File {} {} for all {} tags", index, value ? "set" : "cleared", entries.size());
        return;
    }

    for (const auto& tag : tags) {
        auto it = entries.find(tag);
        if (it != entries.end())
            it->second.fileMask.set(pos, value);
    }
    spdlog::debug("File {} {} for {} named tag(s)", index, value ? "set" : "cleared", tags.size());
}

void TagCollection::removeFileIndex(int index) {
    if (index < 0) return;
    lastChecksum.reset();

    for (auto& p : entries)
        p.second.fileMask.removeAt(static_cast<std::size_t>(index));
    spdlog::debug("File {} removed from {} tag masks", index, entries.size());
}

int TagCollection::appendFile() {
    lastChecksum.reset();
    if (entries.empty()) return -1;

    for (auto& p : entries)
        p.second.fileMask.pushBack(false);

    return static_cast<int>(entries.begin()->second.fileMask.size()) - 1;
}

void TagCollection::loadDefaultTags(std::uint32_t build, std::size_t fileCount) {
    clear();

    for (auto& entry : defaultTags(build, fileCount))
        add(entry.name, entry.typeId, fileCount);

    spdlog::info("Loaded {} default tags for build {}", entries.size(), build);
}

std::vector<const TagEntry*> TagCollection::sortedTags() const {
    std::vector<const TagEntry*> out;
    out.reserve(entries.size());
    for (const auto& p : entries)
        out.push_back(&p.second);

    std::sort(out.begin(), out.end(),
        [](const TagEntry* a, const TagEntry* b) { return tagSortLess(*a, *b); });
    return out;
}

#include "DefaultTags.hpp"

namespace {

struct TagDef {
    const char* name;
    std::uint16_t typeId;
};

const TagDef BASE_TAGS[] = {
    { "OSX", TagType::Platform },
    { "Web", TagType::Platform },
    { "Windows", TagType::Platform },
    { "x86_32", TagType::Architecture },
    { "x86_64", TagType::Architecture },
    { "deDE", TagType::Locale },
    { "enUS", TagType::Locale },
    { "esES", TagType::Locale },
    { "esMX", TagType::Locale },
    { "frFR", TagType::Locale },
    { "itIT", TagType::Locale },
    { "koKR", TagType::Locale },
    { "ptBR", TagType::Locale },
    { "ruRU", TagType::Locale },
    { "zhCN", TagType::Locale },
    { "zhTW", TagType::Locale },
};

const TagDef REGION_TAGS[] = {
    { "CN", TagType::Region },
    { "EU", TagType::Region },
    { "KR", TagType::Region },
    { "TW", TagType::Region },
    { "US", TagType::Region },
};

const TagDef FEATURE_TAGS[] = {
    { "speech", TagType::Feature },
    { "text", TagType::Feature },
    { "Alternate", TagType::Alternate },
};

template <std::size_t N>
void append(std::vector<TagEntry>& out, const TagDef (&defs)[N], std::size_t fileCount) {
    for (const auto& def : defs)
        out.emplace_back(def.name, def.typeId, fileCount);
}

}

std::vector<TagEntry> defaultTags(std::uint32_t build, std::size_t fileCount) {
    std::vector<TagEntry> out;
    append(out, BASE_TAGS, fileCount);

    if (build > REGION_TAGS_AFTER_BUILD)
        append(out, REGION_TAGS, fileCount);

    if (build > FEATURE_TAGS_AFTER_BUILD)
        append(out, FEATURE_TAGS, fileCount);

    return out;
}

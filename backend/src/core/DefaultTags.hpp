#pragma once
#include <cstdint>
#include <vector>
#include "TagEntry.hpp"

// Builds that introduced new tag categories. Archives older than these do
// not carry the corresponding tags.
constexpr std::uint32_t REGION_TAGS_AFTER_BUILD = 18761;
constexpr std::uint32_t FEATURE_TAGS_AFTER_BUILD = 20426;

// Standard tag catalog for `build`, each entry with `fileCount` clear bits.
std::vector<TagEntry> defaultTags(std::uint32_t build, std::size_t fileCount);

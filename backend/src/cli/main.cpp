#include <iostream>
#include <vector>
#include <string>
#include <limits>
#include <cstdint>
#include <exception>

#include "../utils/logging.hpp"
#include "../utils/Strings.hpp"
#include "../storage/Storage.hpp"
#include "../core/TagCollection.hpp"

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <section-file> [build fileCount]\n"
        "  Opens an existing tag section file, or creates one with the default\n"
        "  tags for <build> over <fileCount> files.\n";
}

static void listTags(const TagCollection& tags) {
    std::cout << "\n===== TAGS =====\n";
    if (tags.empty()) {
        std::cout << "No tags.\n";
        return;
    }
    for (const TagEntry* e : tags.sortedTags()) {
        std::cout << "- " << e->name << " (type " << e->typeId << ")  "
            << e->fileMask.count() << "/" << e->fileMask.size() << " files\n";
    }
}

static int askFileIndex(std::uint32_t fileCount) {
    if (fileCount == 0) {
        std::cout << "No files.\n";
        return -1;
    }
    std::cout << "File index [0-" << fileCount - 1 << "]: ";

    int idx;
    if (!(std::cin >> idx)) {
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        return -1;
    }
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');

    if (idx < 0 || static_cast<std::uint32_t>(idx) >= fileCount) {
        std::cout << "Invalid index.\n";
        return -1;
    }
    return idx;
}

int main(int argc, char** argv) {
    if (argc != 2 && argc != 4) {
        usage(argv[0]);
        return 1;
    }

    Log::init();

    const std::string path = argv[1];
    TagCollection tags;
    std::uint32_t fileCount = 0;

    if (argc == 4) {
        std::uint32_t build = 0;
        try {
            build = static_cast<std::uint32_t>(std::stoul(argv[2]));
            fileCount = static_cast<std::uint32_t>(std::stoul(argv[3]));
        }
        catch (const std::exception& e) {
            std::cerr << "Invalid build or file count: " << e.what() << "\n";
            return 1;
        }
        tags.loadDefaultTags(build, fileCount);
        std::cout << "Created " << tags.size() << " default tags for build " << build << ".\n";
    }
    else if (!Storage::loadTagSection(tags, fileCount, path)) {
        std::cerr << "Could not load '" << path << "' (see log).\n";
        return 1;
    }

    while (true) {
        std::cout << "\n===== TAG SECTION =====\n"
            "File: " << path << " (" << fileCount << " files, " << tags.size() << " tags)\n"
            "1. List tags\n"
            "2. Show tags of a file\n"
            "3. Tag a file\n"
            "4. Untag a file\n"
            "5. Clear all tags of a file\n"
            "6. Add tag\n"
            "7. Remove tag\n"
            "8. Append file\n"
            "9. Remove file\n"
            "10. Save & Exit\n"
            "11. Exit without saving\n> ";

        int choice;
        if (!(std::cin >> choice)) {
            if (std::cin.eof()) return 0;
            std::cin.clear(); std::string dummy; std::getline(std::cin, dummy);
            continue;
        }
        std::cin.ignore();

        if (choice == 1) {
            listTags(tags);
        }

        else if (choice == 2) {
            int idx = askFileIndex(fileCount); if (idx < 0) continue;
            std::cout << "Tags:";
            auto view = tags.tagsForFile(idx);
            if (view.empty()) std::cout << " (none)";
            for (const auto& name : view) std::cout << " " << name;
            std::cout << "\n";
        }

        else if (choice == 3 || choice == 4) {
            int idx = askFileIndex(fileCount); if (idx < 0) continue;
            std::cout << "Enter tags (comma-separated): ";
            std::string line; std::getline(std::cin, line);
            auto names = splitTagsLine(line);
            if (names.empty()) { std::cout << "No tags given.\n"; continue; }
            for (const auto& n : names)
                if (!tags.containsTag(n)) std::cout << "Unknown tag '" << n << "' ignored.\n";
            tags.setTags(idx, choice == 3, names);
        }

        else if (choice == 5) {
            int idx = askFileIndex(fileCount); if (idx < 0) continue;
            tags.setTags(idx, false);
        }

        else if (choice == 6) {
            std::string name;
            std::cout << "Tag name: "; std::getline(std::cin, name);
            if (name.empty()) { std::cout << "Name required.\n"; continue; }
            if (tags.containsTag(name)) { std::cout << "Tag exists.\n"; continue; }

            std::cout << "Type id: ";
            unsigned type;
            if (!(std::cin >> type) || type > 0xFFFF) {
                std::cin.clear();
                std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
                std::cout << "Invalid type.\n";
                continue;
            }
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            tags.add(name, static_cast<std::uint16_t>(type), fileCount);
        }

        else if (choice == 7) {
            std::string name;
            std::cout << "Tag name: "; std::getline(std::cin, name);
            if (!tags.containsTag(name)) std::cout << "Not found.\n";
            tags.remove(name);
        }

        else if (choice == 8) {
            int idx = tags.appendFile();
            ++fileCount;
            if (idx >= 0) std::cout << "Appended file " << idx << ".\n";
            else std::cout << "Appended file " << fileCount - 1 << " (no tags to grow).\n";
        }

        else if (choice == 9) {
            int idx = askFileIndex(fileCount); if (idx < 0) continue;
            tags.removeFileIndex(idx);
            --fileCount;
        }

        else if (choice == 10) {
            if (!Storage::saveTagSection(tags, fileCount, path)) {
                std::cout << "Error saving tag section.\n";
                continue;
            }
            std::cout << "Saved (checksum " << tags.checksum()->toHex() << ").\n";
            break;
        }

        else if (choice == 11)
            break;

        else std::cout << "Invalid.\n";
    }

    return 0;
}

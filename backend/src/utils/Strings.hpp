#pragma once
#include <sstream>
#include <string>
#include <vector>

// "enUS, Windows ,,x86_64" -> { "enUS", "Windows", "x86_64" }
inline std::vector<std::string> splitTagsLine(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream iss(line);
    std::string name;
    while (std::getline(iss, name, ',')) {
        auto first = name.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) continue;
        auto last = name.find_last_not_of(" \t\r\n");
        out.push_back(name.substr(first, last - first + 1));
    }
    return out;
}

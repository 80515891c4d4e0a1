#pragma once
#include <stdexcept>
#include <string>

// Raised when tag section bytes cannot be decoded (truncated stream,
// unterminated string, duplicate tag name). The collection being read
// is left partially populated and must be discarded.
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& what)
        : std::runtime_error(what) {}
};

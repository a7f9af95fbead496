#pragma once
// =============================================================================
// emu - Checked Number Parsing
// =============================================================================
// Numbers scraped from tool output or typed by the user. Anything that does
// not fit the target type is "no value", never an exception.
// =============================================================================
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>

namespace emu {

// Leading decimal integer of s ("34", " 34abc")
inline std::optional<int> parseInt(const std::string& s) {
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(begin, &end, 10);
    if (end == begin || errno == ERANGE || v < INT_MIN || v > INT_MAX) return std::nullopt;
    return static_cast<int>(v);
}

// Unsigned variant; a leading '-' is rejected rather than wrapped
inline std::optional<uint64_t> parseUint64(const std::string& s) {
    const size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos || s[first] == '-') return std::nullopt;
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(begin, &end, 10);
    if (end == begin || errno == ERANGE) return std::nullopt;
    return static_cast<uint64_t>(v);
}

inline std::optional<uint32_t> parseUint32(const std::string& s) {
    auto v = parseUint64(s);
    if (!v || *v > UINT32_MAX) return std::nullopt;
    return static_cast<uint32_t>(*v);
}

} // namespace emu

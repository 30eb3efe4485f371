#pragma once
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

namespace geosuggest {

inline std::string to_lower_ascii(std::string s) {
    for (char &c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

// Trim ASCII whitespace from both ends of a string
inline std::string trim_copy(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

// Split on a single delimiter, keeping empty fields
inline std::vector<std::string> split_fields(const std::string& line, char delim) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : line) {
        if (c == delim) {
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    out.push_back(cur);
    return out;
}

// Number of code points in a UTF-8 string (continuation bytes are not counted)
inline uint32_t utf8_length(const std::string& s) {
    uint32_t n = 0;
    for (unsigned char uc : s) {
        if ((uc & 0xC0) != 0x80) n++;
    }
    return n;
}

// Canonical form used for every comparison between catalog text and queries:
// lower-cased, diacritics stripped (Latin scripts), typographic apostrophes
// folded to '\'', whitespace runs collapsed, surrounding whitespace trimmed.
std::string normalize_text(const std::string& text);

// Re-encode as valid UTF-8. Bytes that are not part of a well-formed
// sequence are taken as Latin-1.
std::string to_utf8(const std::string& text);

// Strict numeric parsers: the whole (trimmed) string must be consumed.
bool parse_double(const std::string& s, double& out);
bool parse_u64(const std::string& s, uint64_t& out);

} // namespace geosuggest

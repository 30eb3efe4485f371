#include "textutil.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace geosuggest {

// ASCII folding for U+00C0..U+017F (Latin-1 Supplement letters + Latin Extended-A).
// nullptr = no folding, the code point is kept as-is.
static const char* const kLatinFold[0x180 - 0xC0] = {
    // U+00C0
    "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
    // U+00D0
    "d", "n", "o", "o", "o", "o", "o", nullptr, "o", "u", "u", "u", "u", "y", "th", "ss",
    // U+00E0
    "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
    // U+00F0
    "d", "n", "o", "o", "o", "o", "o", nullptr, "o", "u", "u", "u", "u", "y", "th", "y",
    // U+0100
    "a", "a", "a", "a", "a", "a", "c", "c", "c", "c", "c", "c", "c", "c", "d", "d",
    // U+0110
    "d", "d", "e", "e", "e", "e", "e", "e", "e", "e", "e", "e", "g", "g", "g", "g",
    // U+0120
    "g", "g", "g", "g", "h", "h", "h", "h", "i", "i", "i", "i", "i", "i", "i", "i",
    // U+0130
    "i", "i", "ij", "ij", "j", "j", "k", "k", "k", "l", "l", "l", "l", "l", "l", "l",
    // U+0140
    "l", "l", "l", "n", "n", "n", "n", "n", "n", "n", "n", "n", "o", "o", "o", "o",
    // U+0150
    "o", "o", "oe", "oe", "r", "r", "r", "r", "r", "r", "s", "s", "s", "s", "s", "s",
    // U+0160
    "s", "s", "t", "t", "t", "t", "t", "t", "u", "u", "u", "u", "u", "u", "u", "u",
    // U+0170
    "u", "u", "u", "u", "w", "w", "y", "y", "y", "z", "z", "z", "z", "z", "z", "s",
};

// Decode one code point starting at s[i]; advances i.
// Bytes that do not start a valid sequence are read as Latin-1.
static uint32_t next_code_point(const std::string& s, size_t& i) {
    const size_t n = s.size();
    unsigned char c = (unsigned char)s[i];

    size_t len = 0;
    uint32_t cp = 0;
    if (c < 0x80) { i++; return c; }
    else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
    else { i++; return c; }

    if (i + len > n) { i++; return c; }
    for (size_t k = 1; k < len; k++) {
        unsigned char cc = (unsigned char)s[i + k];
        if ((cc & 0xC0) != 0x80) { i++; return c; }
        cp = (cp << 6) | (cc & 0x3F);
    }

    // Overlong forms, surrogates and values past U+10FFFF are not UTF-8
    static const uint32_t kMinForLen[5] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < kMinForLen[len] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
        i++;
        return c;
    }
    i += len;
    return cp;
}

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back((char)cp);
    } else if (cp < 0x800) {
        out.push_back((char)(0xC0 | (cp >> 6)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back((char)(0xE0 | (cp >> 12)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back((char)(0xF0 | (cp >> 18)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

std::string to_utf8(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) append_utf8(out, next_code_point(text, i));
    return out;
}

static bool is_space_cp(uint32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\v' ||
           cp == '\f' || cp == 0xA0 || cp == 0x2007 || cp == 0x202F;
}

static bool is_combining_mark(uint32_t cp) {
    return (cp >= 0x0300 && cp <= 0x036F) || (cp >= 0x1AB0 && cp <= 0x1AFF) ||
           (cp >= 0x1DC0 && cp <= 0x1DFF) || (cp >= 0x20D0 && cp <= 0x20FF);
}

// Simple case mapping for Greek and Cyrillic capitals
static uint32_t lower_non_latin(uint32_t cp) {
    if (cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) return cp + 0x20;
    if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;
    if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;
    return cp;
}

std::string normalize_text(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    // pending_space: a separator was seen after some output, emitted lazily
    // so that leading/trailing whitespace disappears and runs collapse.
    bool pending_space = false;

    auto emit = [&](const char* s) {
        if (pending_space && !out.empty()) out.push_back(' ');
        pending_space = false;
        out += s;
    };

    size_t i = 0;
    while (i < text.size()) {
        uint32_t cp = next_code_point(text, i);

        if (is_space_cp(cp)) {
            pending_space = true;
            continue;
        }
        if (is_combining_mark(cp)) continue;

        if (cp < 0x80) {
            char buf[2] = {(char)std::tolower((int)cp), '\0'};
            emit(buf);
        } else if (cp >= 0xC0 && cp < 0x180 && kLatinFold[cp - 0xC0] != nullptr) {
            emit(kLatinFold[cp - 0xC0]);
        } else if (cp == 0x0218 || cp == 0x0219) {
            emit("s");
        } else if (cp == 0x021A || cp == 0x021B) {
            emit("t");
        } else if (cp == 0x2018 || cp == 0x2019 || cp == 0x02BC || cp == 0x00B4) {
            emit("'");
        } else {
            std::string enc;
            append_utf8(enc, lower_non_latin(cp));
            emit(enc.c_str());
        }
    }
    return out;
}

bool parse_double(const std::string& s, double& out) {
    std::string t = trim_copy(s);
    if (t.empty()) return false;

    errno = 0;
    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (errno == ERANGE || end != t.c_str() + t.size()) return false;
    if (!std::isfinite(v)) return false;

    out = v;
    return true;
}

bool parse_u64(const std::string& s, uint64_t& out) {
    std::string t = trim_copy(s);
    if (t.empty()) return false;
    for (unsigned char c : t) {
        if (!std::isdigit(c)) return false;
    }

    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(t.c_str(), &end, 10);
    if (errno == ERANGE || end != t.c_str() + t.size()) return false;

    out = (uint64_t)v;
    return true;
}

} // namespace geosuggest

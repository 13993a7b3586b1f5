// lineset/cpp/common/text_common.cpp
#include "text_common.h"

#include <cstdint>
#include <utility>

namespace {

struct Utf8Dec {
    uint32_t cp{0};
    size_t   len{1};
    bool     ok{false};
};

static inline bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

static inline Utf8Dec decode_utf8(std::string_view s, size_t i) {
    Utf8Dec r{};
    if (i >= s.size()) return r;

    const unsigned char c0 = (unsigned char)s[i];
    if (c0 < 0x80) {
        r.cp = c0; r.len = 1; r.ok = true;
        return r;
    }

    size_t len = 0;
    if (c0 >= 0xC2 && c0 <= 0xDF) len = 2;
    else if (c0 >= 0xE0 && c0 <= 0xEF) len = 3;
    else if (c0 >= 0xF0 && c0 <= 0xF4) len = 4;
    else return r;

    if (i + len > s.size()) return r;

    const unsigned char c1 = (unsigned char)s[i + 1];
    if (!is_cont(c1)) return r;

    if (len == 2) {
        r.cp = ((uint32_t)(c0 & 0x1F) << 6) | (uint32_t)(c1 & 0x3F);
        r.len = 2; r.ok = true;
        return r;
    }

    const unsigned char c2 = (unsigned char)s[i + 2];
    if (!is_cont(c2)) return r;

    if (len == 3) {
        // overlong / surrogate checks
        if (c0 == 0xE0 && c1 < 0xA0) return r;
        if (c0 == 0xED && c1 >= 0xA0) return r;
        r.cp = ((uint32_t)(c0 & 0x0F) << 12)
             | ((uint32_t)(c1 & 0x3F) << 6)
             |  (uint32_t)(c2 & 0x3F);
        r.len = 3; r.ok = true;
        return r;
    }

    const unsigned char c3 = (unsigned char)s[i + 3];
    if (!is_cont(c3)) return r;

    if (c0 == 0xF0 && c1 < 0x90) return r;
    if (c0 == 0xF4 && c1 > 0x8F) return r;

    uint32_t cp = ((uint32_t)(c0 & 0x07) << 18)
                | ((uint32_t)(c1 & 0x3F) << 12)
                | ((uint32_t)(c2 & 0x3F) << 6)
                |  (uint32_t)(c3 & 0x3F);
    if (cp > 0x10FFFF) return r;

    r.cp = cp; r.len = 4; r.ok = true;
    return r;
}

// Decodes the code point ending at s[end - 1]. !ok => a stray byte.
static inline Utf8Dec decode_utf8_back(std::string_view s, size_t end) {
    Utf8Dec r{};
    if (end == 0) return r;
    size_t start = end - 1;
    while (start > 0 && end - start < 4 && is_cont((unsigned char)s[start])) --start;
    Utf8Dec d = decode_utf8(s, start);
    if (d.ok && start + d.len == end) return d;
    return r;
}

static inline void append_utf8(uint32_t cp, std::string& out) {
    if (cp <= 0x7F) {
        out.push_back((char)cp);
    } else if (cp <= 0x7FF) {
        out.push_back((char)(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back((char)(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back((char)(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

// Unicode White_Space
static inline bool is_space_cp(uint32_t cp) {
    if (cp == 0x20) return true;
    if (cp >= 0x09 && cp <= 0x0D) return true; // \t \n \v \f \r
    if (cp == 0x0085 || cp == 0x00A0 || cp == 0x1680) return true;
    if (cp >= 0x2000 && cp <= 0x200A) return true;
    if (cp == 0x2028 || cp == 0x2029) return true;
    if (cp == 0x202F || cp == 0x205F || cp == 0x3000) return true;
    return false;
}

// Blocks where upper/lower alternate: even code point = upper.
static inline bool in_even_odd_pairs(uint32_t cp) {
    return (cp >= 0x0100 && cp <= 0x012F)
        || (cp >= 0x0132 && cp <= 0x0137)
        || (cp >= 0x014A && cp <= 0x0177)
        || (cp >= 0x0460 && cp <= 0x0481)
        || (cp >= 0x048A && cp <= 0x04BF)
        || (cp >= 0x04D0 && cp <= 0x052F)
        || (cp >= 0x1E00 && cp <= 0x1E95)
        || (cp >= 0x1EA0 && cp <= 0x1EFF);
}

// Same, odd code point = upper.
static inline bool in_odd_even_pairs(uint32_t cp) {
    return (cp >= 0x0139 && cp <= 0x0148)
        || (cp >= 0x0179 && cp <= 0x017E)
        || (cp >= 0x04C1 && cp <= 0x04CE);
}

static inline uint32_t to_lower_cp(uint32_t cp) {
    // ASCII
    if (cp >= 'A' && cp <= 'Z') return cp - 'A' + 'a';
    if (cp < 0x80) return cp;

    // Latin-1: À..Þ except ×
    if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) return cp + 0x20;

    // Latin Extended-A
    if (cp == 0x0130) return 'i'; // İ
    if (cp == 0x0178) return 0x00FF; // Ÿ
    if (in_even_odd_pairs(cp)) return (cp % 2 == 0) ? cp + 1 : cp;
    if (in_odd_even_pairs(cp)) return (cp % 2 == 1) ? cp + 1 : cp;

    // Greek
    if (cp >= 0x0391 && cp <= 0x03AB && cp != 0x03A2) return cp + 0x20;
    if (cp == 0x0386) return 0x03AC;
    if (cp >= 0x0388 && cp <= 0x038A) return cp + 0x25;
    if (cp == 0x038C) return 0x03CC;
    if (cp == 0x038E || cp == 0x038F) return cp + 0x3F;

    // Cyrillic: Ѐ..Џ, А..Я, Ӏ
    if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;
    if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;
    if (cp == 0x04C0) return 0x04CF;

    // Armenian
    if (cp >= 0x0531 && cp <= 0x0556) return cp + 0x30;

    // ẞ
    if (cp == 0x1E9E) return 0x00DF;

    // Fullwidth Ａ..Ｚ
    if (cp >= 0xFF21 && cp <= 0xFF3A) return cp + 0x20;

    return cp;
}

} // namespace

std::string_view trim_view(std::string_view s) {
    size_t a = 0;
    while (a < s.size()) {
        const Utf8Dec d = decode_utf8(s, a);
        if (!d.ok || !is_space_cp(d.cp)) break;
        a += d.len;
    }
    size_t b = s.size();
    while (b > a) {
        const Utf8Dec d = decode_utf8_back(s, b);
        if (!d.ok || !is_space_cp(d.cp)) break;
        b -= d.len;
    }
    return s.substr(a, b - a);
}

std::string trim_copy(std::string_view s) {
    return std::string(trim_view(s));
}

std::string to_lower_copy(std::string_view s) {
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        const unsigned char b = (unsigned char)s[i];

        // ASCII fast path
        if (b < 0x80) {
            out.push_back((b >= 'A' && b <= 'Z') ? (char)(b - 'A' + 'a') : (char)b);
            ++i;
            continue;
        }

        const Utf8Dec d = decode_utf8(s, i);
        if (!d.ok) {
            out.push_back((char)b); // invalid byte: copied through
            ++i;
            continue;
        }

        append_utf8(to_lower_cp(d.cp), out);
        i += d.len;
    }
    return out;
}

std::string normalize_entry(std::string_view s) {
    return to_lower_copy(trim_view(s));
}

std::vector<std::string> split_lines(std::string_view content) {
    std::vector<std::string> lines;
    std::string cur;
    for (size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];
        if (c == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
            continue; // CRLF -> LF, the '\n' closes the line
        }
        if (c == '\n') {
            lines.push_back(std::move(cur));
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    lines.push_back(std::move(cur));
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    size_t total = 0;
    for (const auto& l : lines) total += l.size() + 1;

    std::string out;
    out.reserve(total);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out.push_back('\n');
        out += lines[i];
    }
    return out;
}

// sufidx/common/text_common.cpp
#include "text_common.h"

namespace {

static inline bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

// Length of the well-formed sequence starting at s[i], or 0.
static inline size_t utf8_seq_len(std::string_view s, size_t i) {
    if (i >= s.size()) return 0;

    const unsigned char c0 = (unsigned char)s[i];
    if (c0 < 0x80) return 1;

    size_t len = 0;
    if (c0 >= 0xC2 && c0 <= 0xDF) len = 2;
    else if (c0 >= 0xE0 && c0 <= 0xEF) len = 3;
    else if (c0 >= 0xF0 && c0 <= 0xF4) len = 4;
    else return 0;

    if (i + len > s.size()) return 0;

    const unsigned char c1 = (unsigned char)s[i + 1];
    if (!is_cont(c1)) return 0;
    if (len == 2) return 2;

    const unsigned char c2 = (unsigned char)s[i + 2];
    if (!is_cont(c2)) return 0;

    if (len == 3) {
        // overlong / surrogate checks
        if (c0 == 0xE0 && c1 < 0xA0) return 0;
        if (c0 == 0xED && c1 >= 0xA0) return 0;
        return 3;
    }

    const unsigned char c3 = (unsigned char)s[i + 3];
    if (!is_cont(c3)) return 0;

    if (c0 == 0xF0 && c1 < 0x90) return 0;
    if (c0 == 0xF4 && c1 > 0x8F) return 0;
    return 4;
}

} // namespace

std::string utf8_drop_invalid(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        const size_t len = utf8_seq_len(s, i);
        if (len == 0) {
            ++i;
            continue;
        }
        out.append(s.data() + i, len);
        i += len;
    }
    return out;
}

size_t utf8_length(std::string_view s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if (!is_cont(c)) ++n;
    }
    return n;
}

std::string collapse_newlines(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\r') continue;
        out.push_back(c == '\n' ? ' ' : c);
    }
    return out;
}

std::string pad_left(std::string_view s, size_t width) {
    const size_t len = utf8_length(s);
    std::string out;
    if (len < width) out.assign(width - len, ' ');
    out.append(s.data(), s.size());
    return out;
}

std::string pad_right(std::string_view s, size_t width) {
    const size_t len = utf8_length(s);
    std::string out(s.data(), s.size());
    if (len < width) out.append(width - len, ' ');
    return out;
}

std::string preview_bytes(std::string_view s) {
    return collapse_newlines(utf8_drop_invalid(s));
}

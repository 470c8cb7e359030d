// sufidx/common/text_common.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// Word bytes are ASCII [0-9A-Za-z] only. Bytes >= 0x80 (any part of a
// multi-byte UTF-8 sequence) never start or continue a word.
inline bool is_word_byte(unsigned char c) {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

// Copies s, dropping bytes that are not part of a well-formed UTF-8 sequence
// (truncated sequences at either end of a byte window included).
std::string utf8_drop_invalid(std::string_view s);

// Number of code points in valid UTF-8 (continuation bytes not counted).
size_t utf8_length(std::string_view s);

// '\n' -> ' ', '\r' removed
std::string collapse_newlines(std::string_view s);

// Pads with spaces to `width` code points; never truncates.
std::string pad_left(std::string_view s, size_t width);
std::string pad_right(std::string_view s, size_t width);

// Short printable rendering of raw bytes for diagnostics.
std::string preview_bytes(std::string_view s);

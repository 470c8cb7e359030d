// sufidx/include/sufidx/search.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "sufidx/format.h"
#include "sufidx/mapped_file.h"
#include "sufidx/result.h"

namespace sufidx {

struct SearchOptions {
    uint32_t max_matches{kNumMatches};
    uint32_t context{kContext};   // bytes on each side
    bool trim_lines{false};       // cut context at the nearest newline
};

// Lowest index position whose suffix starts with `key`, or nullopt.
std::optional<size_t> binary_search_first(std::string_view key,
                                          const MappedIntArray& index,
                                          const MappedBytes& text);

// True if the suffix at `ptr` starts with `key`.
bool prefix_matches(std::string_view key, uint32_t ptr, const MappedBytes& text);

// Matches in index order, at most opt.max_matches.
SearchResult search_index(const MappedBytes& text, const MappedIntArray& index,
                          const std::string& query, const SearchOptions& opt);

// Opens both files read-only.
SearchResult search_files(const std::filesystem::path& text_path,
                          const std::filesystem::path& index_path,
                          const std::string& query, const SearchOptions& opt);

// Match text [start, end) with up to opt.context bytes on both sides.
Match keyword_in_context(const MappedBytes& text, size_t start, size_t end,
                         const SearchOptions& opt);

// "   12345:  <left right-aligned>|match|<right left-aligned>"
std::string format_match_line(const Match& m, uint32_t context);

} // namespace sufidx

// sufidx/src/search.cpp
#include "sufidx/search.h"

#include <algorithm>
#include <cstdio>

#include "text_common.h"

namespace sufidx {

bool prefix_matches(std::string_view key, uint32_t ptr, const MappedBytes& text) {
    return text.view(ptr, key.size()) == key;
}

std::optional<size_t> binary_search_first(std::string_view key,
                                          const MappedIntArray& index,
                                          const MappedBytes& text) {
    const size_t n = index.size();
    if (n == 0) return std::nullopt;

    // the first match, if any, stays inside [low, high]
    size_t low = 0;
    size_t high = n - 1;
    while (high - low > 1) {
        const size_t mid = low + (high - low) / 2;
        const std::string_view candidate = text.view(index.get(mid), key.size());
        if (key > candidate) {
            low = mid + 1;
        } else {
            high = mid;
        }
    }

    if (prefix_matches(key, index.get(low), text)) return low;
    if (prefix_matches(key, index.get(high), text)) return high;
    return std::nullopt;
}

Match keyword_in_context(const MappedBytes& text, size_t start, size_t end,
                         const SearchOptions& opt) {
    const size_t ctx = opt.context;
    const size_t context_start = (start > ctx) ? start - ctx : 0;
    const size_t context_end = std::min(text.size(), end + ctx);

    std::string prefix = utf8_drop_invalid(text.view(context_start, start - context_start));
    std::string found  = utf8_drop_invalid(text.view(start, end - start));
    std::string suffix = utf8_drop_invalid(text.view(end, context_end - end));

    Match m;
    m.offset = start;
    m.text = collapse_newlines(found);

    if (opt.trim_lines) {
        const size_t nl_left = prefix.rfind('\n');
        if (nl_left != std::string::npos) prefix.erase(0, nl_left + 1);
        const size_t nl_right = suffix.find('\n');
        if (nl_right != std::string::npos) suffix.erase(nl_right);
        m.left = std::move(prefix);
        m.right = std::move(suffix);
    } else {
        m.left = collapse_newlines(prefix);
        m.right = collapse_newlines(suffix);
    }
    return m;
}

SearchResult search_index(const MappedBytes& text, const MappedIntArray& index,
                          const std::string& query, const SearchOptions& opt) {
    SearchResult r;
    r.query = query;

    const auto first = binary_search_first(query, index, text);
    if (!first) return r;
    r.first_index = *first;

    for (size_t i = *first; i < index.size(); ++i) {
        if (r.matches.size() >= opt.max_matches) break;
        const uint32_t ptr = index.get(i);
        // sorted: the matching entries are contiguous
        if (!prefix_matches(query, ptr, text)) break;
        r.matches.push_back(keyword_in_context(text, ptr, (size_t)ptr + query.size(), opt));
    }
    return r;
}

SearchResult search_files(const std::filesystem::path& text_path,
                          const std::filesystem::path& index_path,
                          const std::string& query, const SearchOptions& opt) {
    MappedBytes text(text_path, MapMode::ReadOnly);
    MappedIntArray index(index_path, MapMode::ReadOnly);
    return search_index(text, index, query, opt);
}

std::string format_match_line(const Match& m, uint32_t context) {
    char head[32];
    std::snprintf(head, sizeof(head), "%8llu:  ", (unsigned long long)m.offset);

    std::string line = head;
    line += pad_left(m.left, context);
    line += '|';
    line += m.text;
    line += '|';
    line += pad_right(m.right, context);
    return line;
}

} // namespace sufidx

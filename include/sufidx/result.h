// sufidx/include/sufidx/result.h
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sufidx {

struct Match {
    uint64_t offset{0};  // byte offset of the match in the text
    std::string left;    // context before the match
    std::string text;    // the match itself, newlines collapsed
    std::string right;   // context after the match
};

struct SearchResult {
    std::string query;
    std::optional<uint64_t> first_index; // index position of the first match
    std::vector<Match> matches;
};

nlohmann::json to_json(const SearchResult& r);

} // namespace sufidx

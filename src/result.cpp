// sufidx/src/result.cpp
#include "sufidx/result.h"

namespace sufidx {

nlohmann::json to_json(const SearchResult& r) {
    nlohmann::json j;
    j["query"] = r.query;
    if (r.first_index) j["first_index"] = *r.first_index;
    else j["first_index"] = nullptr;

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& m : r.matches) {
        nlohmann::json e;
        e["offset"] = m.offset;
        e["left"] = m.left;
        e["match"] = m.text;
        e["right"] = m.right;
        arr.push_back(std::move(e));
    }
    j["matches"] = std::move(arr);
    j["count"] = r.matches.size();
    return j;
}

} // namespace sufidx

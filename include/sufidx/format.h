#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace sufidx {

// Index file: flat array of uint32_t text offsets, native byte order, no header.
constexpr size_t   kElemSize          = sizeof(uint32_t);
constexpr size_t   kCompareBufferSize = 100;     // bounded sort key, bytes
constexpr size_t   kSortingCutoff     = 10000;   // quicksort -> std::stable_sort
constexpr uint32_t kNumMatches        = 20;
constexpr uint32_t kContext           = 40;      // bytes of context on each side
constexpr size_t   kMaxReportedErrors = 10;
constexpr size_t   kPreviewBytes      = 20;

constexpr const char* kIndexSuffix = ".ix";

// "corpus.txt" + ".ix" -> "corpus.ix", "corpus" + ".ix" -> "corpus.ix"
std::filesystem::path derive_index_path(const std::filesystem::path& textfile,
                                        const std::string& suffix);

std::string utc_now_compact();

} // namespace sufidx

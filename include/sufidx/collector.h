// sufidx/include/sufidx/collector.h
#pragma once
#include <cstdint>
#include <filesystem>

#include "sufidx/mapped_file.h"
#include "sufidx/progress.h"

namespace sufidx {

// Appends the offset of every word start (a word byte preceded by a non-word
// byte, or offset 0 if it is a word byte) in ascending order.
// Returns the number of offsets appended.
uint64_t collect_positions(const MappedBytes& text, IntArrayBuilder& index,
                           ProgressObserver* progress = nullptr);

// Opens text read-only, truncates index_path and runs collect_positions.
uint64_t collect_corpus_positions(const std::filesystem::path& text_path,
                                  const std::filesystem::path& index_path,
                                  ProgressObserver* progress = nullptr);

uint64_t count_word_starts(const MappedBytes& text);

} // namespace sufidx

// sufidx/src/collector.cpp
#include "sufidx/collector.h"
#include "sufidx/errors.h"

#include <limits>
#include <string>

#include "text_common.h"

namespace sufidx {

namespace {

constexpr size_t kProgressStep = 1u << 20;

template <class Emit>
void scan_word_starts(const MappedBytes& text, ProgressObserver* progress, Emit&& emit) {
    const size_t n = text.size();
    if (n > (size_t)std::numeric_limits<uint32_t>::max()) {
        throw IndexException(ErrorCode::InvalidArgs,
                             "text too large for 32-bit offsets: " + std::to_string(n) + " bytes");
    }

    const unsigned char* p = text.data();
    bool prev_word = false;
    for (size_t i = 0; i < n; ++i) {
        const bool cur_word = is_word_byte(p[i]);
        if (cur_word && !prev_word) emit((uint32_t)i);
        prev_word = cur_word;

        if (progress && (i + 1) % kProgressStep == 0) progress->advance(i + 1);
    }
}

} // namespace

uint64_t collect_positions(const MappedBytes& text, IntArrayBuilder& index,
                           ProgressObserver* progress) {
    if (progress) progress->begin("collecting positions", text.size());

    uint64_t appended = 0;
    scan_word_starts(text, progress, [&](uint32_t pos) {
        index.append(pos);
        ++appended;
    });

    if (progress) progress->end();
    return appended;
}

uint64_t collect_corpus_positions(const std::filesystem::path& text_path,
                                  const std::filesystem::path& index_path,
                                  ProgressObserver* progress) {
    MappedBytes text(text_path, MapMode::ReadOnly);
    text.region().advise_sequential();

    IntArrayBuilder index(index_path);
    const uint64_t n = collect_positions(text, index, progress);
    index.finish();
    return n;
}

uint64_t count_word_starts(const MappedBytes& text) {
    uint64_t n = 0;
    scan_word_starts(text, nullptr, [&](uint32_t) { ++n; });
    return n;
}

} // namespace sufidx

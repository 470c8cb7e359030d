// sufidx/src/validator.cpp
#include "sufidx/validator.h"
#include "sufidx/collector.h"
#include "sufidx/sort_keys.h"

#include <algorithm>
#include <cstdio>
#include <ostream>
#include <sstream>
#include <utility>

#include "text_common.h"

namespace sufidx {

namespace {

constexpr size_t kProgressStep = 1u << 16;

void record(ValidationResult& vr, const ValidateOptions& opt, std::string msg) {
    ++vr.error_count;
    if (vr.errors.size() < opt.max_reported) vr.errors.push_back(std::move(msg));
}

} // namespace

ValidationResult validate_suffix_array(const MappedBytes& text,
                                       const MappedIntArray& index,
                                       const ValidateOptions& opt,
                                       ProgressObserver* progress) {
    ValidationResult vr;
    const size_t n = index.size();
    const size_t text_size = text.size();

    if (progress) progress->begin("testing sortedness", n);

    ExactKey key(text);
    bool prev_ok = false;
    uint32_t prev = 0;

    for (size_t i = 0; i < n; ++i) {
        const uint32_t cur = index.get(i);
        const bool cur_ok = (size_t)cur < text_size;

        if (!cur_ok) {
            std::ostringstream oss;
            oss << "position " << i << ": pointer " << cur
                << " out of range (text size " << text_size << ")";
            record(vr, opt, oss.str());
        } else if (i > 0 && prev_ok && key.compare(prev, cur) >= 0) {
            std::ostringstream oss;
            oss << "Error in position " << i << ":  "
                << preview_bytes(text.view(prev, kPreviewBytes)) << "  >=  "
                << preview_bytes(text.view(cur, kPreviewBytes));
            record(vr, opt, oss.str());
        }

        prev = cur;
        prev_ok = cur_ok;
        ++vr.checked;
        if (progress && (i + 1) % kProgressStep == 0) progress->advance(i + 1);
    }

    if (progress) progress->end();

    if (opt.check_complete) {
        const uint64_t expect = count_word_starts(text);
        if (expect != (uint64_t)n) {
            std::ostringstream oss;
            oss << "index has " << n << " entries, text has " << expect << " word starts";
            record(vr, opt, oss.str());
        }
    }

    vr.ok = (vr.error_count == 0);
    return vr;
}

ValidationResult validate_index_files(const std::filesystem::path& text_path,
                                      const std::filesystem::path& index_path,
                                      const ValidateOptions& opt,
                                      ProgressObserver* progress) {
    MappedBytes text(text_path, MapMode::ReadOnly);
    MappedIntArray index(index_path, MapMode::ReadOnly);
    index.region().advise_sequential();
    return validate_suffix_array(text, index, opt, progress);
}

void dump_suffix_array(const MappedBytes& text, const MappedIntArray& index,
                       size_t num, std::ostream& os) {
    const size_t size = index.size();

    auto print_line = [&](size_t i) {
        const uint32_t ptr = index.get(i);
        char head[48];
        std::snprintf(head, sizeof(head), "%8zu. %8u: ", i, (unsigned)ptr);
        os << head << preview_bytes(text.view(ptr, kPreviewBytes)) << "\n";
    };

    os << std::string(40, '-') << "\n";
    if (size <= 3 * num) {
        for (size_t i = 0; i < size; ++i) print_line(i);
    } else {
        for (size_t i = 0; i < num; ++i) print_line(i);
        os << "     ...\n";
        for (size_t i = size / 2; i < size / 2 + num; ++i) print_line(i);
        os << "     ...\n";
        for (size_t i = size - num; i < size; ++i) print_line(i);
    }
    os << std::string(40, '-') << "\n";
}

} // namespace sufidx

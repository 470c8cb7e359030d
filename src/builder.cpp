// sufidx/src/builder.cpp
#include "sufidx/builder.h"
#include "sufidx/collector.h"
#include "sufidx/errors.h"
#include "sufidx/mapped_file.h"
#include "sufidx/pivot.h"
#include "sufidx/sorter.h"

#include <chrono>
#include <random>

namespace fs = std::filesystem;

namespace sufidx {

namespace {

using clock_type = std::chrono::steady_clock;

double seconds_since(clock_type::time_point t0) {
    return std::chrono::duration<double>(clock_type::now() - t0).count();
}

} // namespace

BuildStats build_suffix_array(const fs::path& text_path,
                              const BuildOptions& opt,
                              ProgressObserver* progress) {
    BuildStats st;
    st.text_path = text_path;
    st.index_path = derive_index_path(text_path, opt.suffix);
    st.cutoff = opt.cutoff;
    st.built_at_utc = utc_now_compact();

    std::error_code ec;
    if (!fs::is_regular_file(text_path, ec)) {
        throw IndexException(ErrorCode::IoError, "text file not found: " + text_path.string());
    }

    const uint64_t seed = (opt.seed != 0) ? opt.seed : (uint64_t)std::random_device{}();
    auto pivot = make_pivot_selector(opt.pivot, seed);
    st.pivot = pivot->name();

    // 1) word starts -> index file
    auto t0 = clock_type::now();
    st.positions = collect_corpus_positions(text_path, st.index_path, progress);
    st.collect_seconds = seconds_since(t0);

    // 2) sort in place
    {
        MappedBytes text(text_path, MapMode::ReadOnly);
        MappedIntArray index(st.index_path, MapMode::ReadWrite);
        st.text_bytes = text.size();

        if ((uint64_t)index.size() != st.positions) {
            throw IndexException(ErrorCode::InvalidFormat,
                                 "index size mismatch: got=" + std::to_string(index.size()) +
                                 " expect=" + std::to_string(st.positions));
        }

        const SortStats ss = sort_suffix_array(index, text, *pivot, opt.cutoff, progress);
        st.prefix_comparisons = ss.prefix_comparisons;
        st.exact_comparisons = ss.exact_comparisons;
        st.quicksort_seconds = ss.quicksort_seconds;
        st.insertion_seconds = ss.insertion_seconds;
    }

    // 3) verify
    if (opt.verify) {
        ValidateOptions vo;
        vo.max_reported = opt.max_reported_errors;
        t0 = clock_type::now();
        st.validation = validate_index_files(text_path, st.index_path, vo, progress);
        st.verify_seconds = seconds_since(t0);
        st.verified = true;
    } else {
        st.validation.ok = true;
    }

    return st;
}

} // namespace sufidx

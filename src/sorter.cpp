// sufidx/src/sorter.cpp
#include "sufidx/sorter.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <utility>
#include <vector>

namespace sufidx {

size_t partition(MappedIntArray& array, size_t lo, size_t hi,
                 const SortKey& key, PivotSelector& pivot) {
    const size_t p = pivot.select(array, lo, hi, key);
    array.swap(lo, p);
    const uint32_t pivot_value = array.get(lo);

    // signed: j may step just below i
    int64_t i = (int64_t)lo + 1;
    int64_t j = (int64_t)hi - 1;
    while (true) {
        while (i <= j && key.compare(array.get((size_t)i), pivot_value) < 0) ++i;
        while (i <= j && key.compare(array.get((size_t)j), pivot_value) > 0) --j;
        if (i > j) break;
        array.swap((size_t)i, (size_t)j);
        ++i;
        --j;
    }
    array.swap(lo, (size_t)j);
    return (size_t)j;
}

void sort_subrange(MappedIntArray& array, size_t lo, size_t hi, const SortKey& key) {
    if (hi - lo < 2) return;
    std::vector<uint32_t> buf;
    buf.reserve(hi - lo);
    for (size_t i = lo; i < hi; ++i) buf.push_back(array.get(i));

    std::stable_sort(buf.begin(), buf.end(),
                     [&key](uint32_t a, uint32_t b) { return key.less(a, b); });

    for (size_t i = lo; i < hi; ++i) array.set(i, buf[i - lo]);
}

void quicksort(MappedIntArray& array, const SortKey& key, PivotSelector& pivot,
               size_t cutoff, ProgressObserver* progress) {
    const size_t n = array.size();
    if (progress) progress->begin("quicksorting", n);

    std::vector<std::pair<size_t, size_t>> stack;
    stack.reserve(64);
    stack.emplace_back(0, n);

    uint64_t done = 0;

    while (!stack.empty()) {
        const auto [lo, hi] = stack.back();
        stack.pop_back();

        const size_t size = hi - lo;
        if (size == 0) continue;

        if (size <= cutoff) {
            sort_subrange(array, lo, hi, key);
            done += size;
        } else {
            const size_t p = partition(array, lo, hi, key, pivot);
            done += 1;

            // larger side below the smaller one
            if (p - lo < hi - (p + 1)) {
                stack.emplace_back(p + 1, hi);
                stack.emplace_back(lo, p);
            } else {
                stack.emplace_back(lo, p);
                stack.emplace_back(p + 1, hi);
            }
        }
        if (progress) progress->advance(done);
    }

    if (progress) progress->end();
}

void insertion_sort(MappedIntArray& array, const SortKey& key, ProgressObserver* progress) {
    const size_t n = array.size();
    if (progress) progress->begin("insertion sort", n);

    for (size_t i = 1; i < n; ++i) {
        const uint32_t v = array.get(i);
        size_t j = i;
        while (j > 0) {
            const uint32_t left = array.get(j - 1);
            if (key.compare(left, v) <= 0) break;
            array.set(j, left);
            --j;
        }
        if (j != i) array.set(j, v);
        if (progress) progress->advance(i + 1);
    }

    if (progress) progress->end();
}

SortStats sort_suffix_array(MappedIntArray& array, const MappedBytes& text,
                            PivotSelector& pivot, size_t cutoff,
                            ProgressObserver* progress) {
    using clock = std::chrono::steady_clock;

    SortStats st;
    st.elements = array.size();

    array.region().advise_random();

    PrefixKey prefix(text);
    CountingKey prefix_counted(prefix);
    auto t0 = clock::now();
    quicksort(array, prefix_counted, pivot, cutoff, progress);
    st.quicksort_seconds = std::chrono::duration<double>(clock::now() - t0).count();
    st.prefix_comparisons = prefix_counted.comparisons();

    ExactKey exact(text);
    CountingKey exact_counted(exact);
    t0 = clock::now();
    insertion_sort(array, exact_counted, progress);
    st.insertion_seconds = std::chrono::duration<double>(clock::now() - t0).count();
    st.exact_comparisons = exact_counted.comparisons();

    return st;
}

} // namespace sufidx

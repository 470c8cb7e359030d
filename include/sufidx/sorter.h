// sufidx/include/sufidx/sorter.h
#pragma once
#include <cstddef>
#include <cstdint>

#include "sufidx/mapped_file.h"
#include "sufidx/pivot.h"
#include "sufidx/progress.h"
#include "sufidx/sort_keys.h"

namespace sufidx {

struct SortStats {
    uint64_t elements{0};
    uint64_t prefix_comparisons{0};
    uint64_t exact_comparisons{0};
    double quicksort_seconds{0.0};
    double insertion_seconds{0.0};
};

// Hoare partition of [lo, hi), hi > lo. Returns the pivot's final index p:
// keys in [lo, p) are <= the pivot key, keys in (p, hi) are >= it.
size_t partition(MappedIntArray& array, size_t lo, size_t hi,
                 const SortKey& key, PivotSelector& pivot);

// Sorts [lo, hi) in memory with std::stable_sort and writes it back.
void sort_subrange(MappedIntArray& array, size_t lo, size_t hi, const SortKey& key);

// Ranges of size <= cutoff go to sort_subrange. Iterative, the explicit stack
// holds O(log n) ranges because the smaller side is always handled first.
void quicksort(MappedIntArray& array, const SortKey& key, PivotSelector& pivot,
               size_t cutoff, ProgressObserver* progress = nullptr);

void insertion_sort(MappedIntArray& array, const SortKey& key,
                    ProgressObserver* progress = nullptr);

// Approximate quicksort on the bounded prefix key, then an exact insertion
// sort pass. The result satisfies the suffix array ordering.
SortStats sort_suffix_array(MappedIntArray& array, const MappedBytes& text,
                            PivotSelector& pivot, size_t cutoff,
                            ProgressObserver* progress = nullptr);

} // namespace sufidx

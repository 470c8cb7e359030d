// sufidx/src/pivot.cpp
#include "sufidx/pivot.h"
#include "sufidx/errors.h"

namespace sufidx {

size_t TakeFirstPivot::select(const MappedIntArray&, size_t lo, size_t, const SortKey&) {
    return lo;
}

size_t RandomPivot::select(const MappedIntArray&, size_t lo, size_t hi, const SortKey&) {
    std::uniform_int_distribution<size_t> dist(lo, hi - 1);
    return dist(rng_);
}

size_t MedianOfThreePivot::select(const MappedIntArray& array, size_t lo, size_t hi, const SortKey& key) {
    const size_t last = hi - 1;
    const size_t mid = (lo + last) / 2;

    const uint32_t low_v  = array.get(lo);
    const uint32_t mid_v  = array.get(mid);
    const uint32_t high_v = array.get(last);

    // three-way comparisons, each computed once
    const int lh = key.compare(low_v, high_v);
    const int lm = key.compare(low_v, mid_v);
    const int mh = key.compare(mid_v, high_v);

    // x is the median iff it lies between the other two (inclusive)
    if ((lh >= 0 && lm <= 0) || (lh <= 0 && lm >= 0)) return lo;
    if ((mh >= 0 && lm >= 0) || (mh <= 0 && lm <= 0)) return mid;
    return last;
}

std::unique_ptr<PivotSelector> make_pivot_selector(const std::string& name, uint64_t seed) {
    if (name == "take-first") return std::make_unique<TakeFirstPivot>();
    if (name == "random") return std::make_unique<RandomPivot>(seed);
    if (name == "median-of-three") return std::make_unique<MedianOfThreePivot>();
    throw IndexException(ErrorCode::InvalidArgs,
                         "unknown pivot selector: '" + name + "' (take-first|random|median-of-three)");
}

} // namespace sufidx

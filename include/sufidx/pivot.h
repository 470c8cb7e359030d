// sufidx/include/sufidx/pivot.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>

#include "sufidx/mapped_file.h"
#include "sufidx/sort_keys.h"

namespace sufidx {

// Picks a pivot index in [lo, hi). Called only with hi > lo.
class PivotSelector {
public:
    virtual ~PivotSelector() = default;
    virtual size_t select(const MappedIntArray& array, size_t lo, size_t hi, const SortKey& key) = 0;
    virtual const char* name() const = 0;
};

class TakeFirstPivot : public PivotSelector {
public:
    size_t select(const MappedIntArray& array, size_t lo, size_t hi, const SortKey& key) override;
    const char* name() const override { return "take-first"; }
};

class RandomPivot : public PivotSelector {
public:
    explicit RandomPivot(uint64_t seed = std::random_device{}()) : rng_(seed) {}

    size_t select(const MappedIntArray& array, size_t lo, size_t hi, const SortKey& key) override;
    const char* name() const override { return "random"; }

private:
    std::mt19937_64 rng_;
};

// Median of array[lo], array[(lo+hi-1)/2], array[hi-1] under the key.
// Candidates are tested in that order; with tied keys the first wins.
class MedianOfThreePivot : public PivotSelector {
public:
    size_t select(const MappedIntArray& array, size_t lo, size_t hi, const SortKey& key) override;
    const char* name() const override { return "median-of-three"; }
};

// "take-first", "random", "median-of-three"
std::unique_ptr<PivotSelector> make_pivot_selector(const std::string& name, uint64_t seed);

} // namespace sufidx

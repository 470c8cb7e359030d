// sufidx/include/sufidx/sort_keys.h
#pragma once
#include <cstddef>
#include <cstdint>

#include "sufidx/format.h"
#include "sufidx/mapped_file.h"

namespace sufidx {

// Orders index entries (text offsets) by the text they point to.
// compare() returns <0, 0 or >0, like memcmp.
class SortKey {
public:
    virtual ~SortKey() = default;
    virtual int compare(uint32_t a, uint32_t b) const = 0;

    bool less(uint32_t a, uint32_t b) const { return compare(a, b) < 0; }
};

// First `width` bytes of the suffix. Cheap, but suffixes sharing a longer
// prefix compare equal.
class PrefixKey : public SortKey {
public:
    explicit PrefixKey(const MappedBytes& text, size_t width = kCompareBufferSize)
        : text_(text), width_(width) {}

    int compare(uint32_t a, uint32_t b) const override;

private:
    const MappedBytes& text_;
    size_t width_;
};

// Whole suffix, compared chunk by chunk up to the end of the text.
// A suffix that is a prefix of another one sorts first.
class ExactKey : public SortKey {
public:
    explicit ExactKey(const MappedBytes& text, size_t chunk = kCompareBufferSize)
        : text_(text), chunk_(chunk == 0 ? 1 : chunk) {}

    int compare(uint32_t a, uint32_t b) const override;

private:
    const MappedBytes& text_;
    size_t chunk_;
};

// Counts calls to the wrapped key. Debug aid, adds a virtual call per compare.
class CountingKey : public SortKey {
public:
    explicit CountingKey(const SortKey& inner) : inner_(inner) {}

    int compare(uint32_t a, uint32_t b) const override {
        ++comparisons_;
        return inner_.compare(a, b);
    }

    uint64_t comparisons() const { return comparisons_; }
    void reset() { comparisons_ = 0; }

private:
    const SortKey& inner_;
    mutable uint64_t comparisons_{0};
};

} // namespace sufidx

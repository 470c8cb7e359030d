// sufidx/include/sufidx/builder.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

#include "sufidx/format.h"
#include "sufidx/progress.h"
#include "sufidx/validator.h"

namespace sufidx {

struct BuildOptions {
    std::string suffix{kIndexSuffix};   // index path = text path with this extension
    size_t cutoff{kSortingCutoff};      // quicksort ranges <= cutoff use std::stable_sort
    std::string pivot{"median-of-three"};
    uint64_t seed{0};                   // RandomPivot seed; 0 => random_device

    bool verify{true};
    size_t max_reported_errors{kMaxReportedErrors};
};

struct BuildStats {
    std::filesystem::path text_path;
    std::filesystem::path index_path;
    uint64_t text_bytes{0};
    uint64_t positions{0};

    size_t cutoff{0};
    std::string pivot;
    uint64_t prefix_comparisons{0};
    uint64_t exact_comparisons{0};

    double collect_seconds{0.0};
    double quicksort_seconds{0.0};
    double insertion_seconds{0.0};
    double verify_seconds{0.0};

    bool verified{false};
    ValidationResult validation;   // ok == false => ordering errors
    std::string built_at_utc;
};

// Collect word starts, sort, verify. I/O failures throw IndexException;
// ordering errors are reported in stats.validation.
BuildStats build_suffix_array(const std::filesystem::path& text_path,
                              const BuildOptions& opt,
                              ProgressObserver* progress = nullptr);

} // namespace sufidx

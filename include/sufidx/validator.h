// sufidx/include/sufidx/validator.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

#include "sufidx/format.h"
#include "sufidx/mapped_file.h"
#include "sufidx/progress.h"

namespace sufidx {

struct ValidateOptions {
    size_t max_reported{kMaxReportedErrors};
    bool check_complete{false}; // index length == number of word starts
};

struct ValidationResult {
    bool ok{false};
    uint64_t checked{0};     // index entries visited
    uint64_t error_count{0}; // all errors, reported or not
    std::vector<std::string> errors; // first max_reported messages
};

ValidationResult validate_suffix_array(const MappedBytes& text,
                                       const MappedIntArray& index,
                                       const ValidateOptions& opt = {},
                                       ProgressObserver* progress = nullptr);

// Standalone check of an index built earlier; opens both files read-only.
ValidationResult validate_index_files(const std::filesystem::path& text_path,
                                      const std::filesystem::path& index_path,
                                      const ValidateOptions& opt = {},
                                      ProgressObserver* progress = nullptr);

// First, middle and last `num` entries as "i. ptr: preview" lines.
void dump_suffix_array(const MappedBytes& text, const MappedIntArray& index,
                       size_t num, std::ostream& os);

} // namespace sufidx

// sufidx/src/format.cpp
#include "sufidx/format.h"
#include "sufidx/errors.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sufidx {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:               return "ok";
        case ErrorCode::IoError:          return "io_error";
        case ErrorCode::InvalidFormat:    return "invalid_format";
        case ErrorCode::InvalidArgs:      return "invalid_args";
        case ErrorCode::OutOfRange:       return "out_of_range";
        case ErrorCode::ReadOnly:         return "read_only";
    }
    return "unknown";
}

std::filesystem::path derive_index_path(const std::filesystem::path& textfile,
                                        const std::string& suffix) {
    if (suffix.empty() || suffix[0] != '.' || suffix.size() < 2) {
        throw IndexException(ErrorCode::InvalidArgs, "invalid index suffix: '" + suffix + "'");
    }
    if (textfile.filename().empty()) {
        throw IndexException(ErrorCode::InvalidArgs, "text path has no file name: " + textfile.string());
    }
    std::filesystem::path p = textfile;
    p.replace_extension(suffix);
    if (p == textfile) {
        throw IndexException(ErrorCode::InvalidArgs,
                             "index path would overwrite the text file: " + textfile.string());
    }
    return p;
}

std::string utc_now_compact() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

} // namespace sufidx

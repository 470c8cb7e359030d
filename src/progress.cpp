// sufidx/src/progress.cpp
#include "sufidx/progress.h"

#include <algorithm>
#include <cstdio>
#include <ostream>

namespace sufidx {

StderrProgress::StderrProgress(std::ostream& os, int barwidth)
    : os_(os), barwidth_(std::max(1, barwidth)) {}

void StderrProgress::begin(std::string_view stage, uint64_t total) {
    if (active_) end();
    stage_.assign(stage.data(), stage.size());
    total_ = total;
    done_ = 0;
    // ~200 redraws per stage at most
    interval_ = std::max<uint64_t>(1, total_ / 200);
    next_print_ = interval_;
    start_ = std::chrono::steady_clock::now();
    active_ = true;
    print_line();
}

void StderrProgress::advance(uint64_t done) {
    if (!active_) return;
    done_ = std::min(done, total_);
    if (done_ >= next_print_) {
        next_print_ = done_ + interval_;
        print_line();
    }
}

void StderrProgress::end() {
    if (!active_) return;
    done_ = total_;
    print_line();
    os_ << "\n";
    os_.flush();
    active_ = false;
}

void StderrProgress::print_line() {
    const double frac = (total_ == 0) ? 1.0 : (double)done_ / (double)total_;
    const int hashes = (int)(frac * barwidth_ + 0.5);
    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();

    std::string bar = "[";
    for (int i = 0; i < barwidth_; ++i) bar += (i < hashes) ? "=" : "\xC2\xB7";
    bar += "]";

    const bool mega = total_ >= 10000000ull;
    const double unit = mega ? 1e6 : 1e3;
    const char suffix = mega ? 'M' : 'k';

    char line[256];
    std::snprintf(line, sizeof(line), "%-22s %3d%% %s %6.0f%c of %.0f%c | %6.1f s",
                  stage_.c_str(), (int)(frac * 100.0 + 0.5), bar.c_str(),
                  (double)done_ / unit, suffix, (double)total_ / unit, suffix, elapsed);
    os_ << "\r" << line;
    os_.flush();
}

} // namespace sufidx

#pragma once
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace sufidx {

// Optional hook for long-running stages. Every core operation takes a
// nullable ProgressObserver*; nothing is reported when it is null.
class ProgressObserver {
public:
    virtual ~ProgressObserver() = default;

    virtual void begin(std::string_view stage, uint64_t total) = 0;
    // done is absolute (items processed so far), not an increment
    virtual void advance(uint64_t done) = 0;
    virtual void end() = 0;
};

// "collecting positions  42% [========············]  1234k of 2938k |    3.1 s"
class StderrProgress : public ProgressObserver {
public:
    explicit StderrProgress(std::ostream& os, int barwidth = 20);

    void begin(std::string_view stage, uint64_t total) override;
    void advance(uint64_t done) override;
    void end() override;

private:
    void print_line();

    std::ostream& os_;
    int barwidth_;
    std::string stage_;
    uint64_t total_{0};
    uint64_t done_{0};
    uint64_t interval_{1};
    uint64_t next_print_{0};
    bool active_{false};
    std::chrono::steady_clock::time_point start_{};
};

} // namespace sufidx

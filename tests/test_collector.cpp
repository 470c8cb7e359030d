#include <cassert>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include "sufidx/collector.h"
#include "sufidx/mapped_file.h"

static std::filesystem::path mk_tmp_dir() {
    auto base = std::filesystem::temp_directory_path();
    auto p = base / ("sufidx_test_collector_" + std::to_string((uint64_t)std::time(nullptr)) + "_" +
                     std::to_string((long)::getpid()));
    std::filesystem::create_directories(p);
    return p;
}

static std::filesystem::path test_data_file(const char* name) {
#ifndef SUFIDX_TEST_DATA_DIR
    return std::filesystem::path("tests/data") / name; // fallback
#else
    return std::filesystem::path(SUFIDX_TEST_DATA_DIR) / name;
#endif
}

static std::vector<uint32_t> collect(const std::filesystem::path& dir, const std::string& content) {
    const auto txt = dir / "in.txt";
    const auto ix = dir / "in.ix";
    {
        std::ofstream out(txt, std::ios::binary);
        out.write(content.data(), (std::streamsize)content.size());
    }
    const uint64_t n = sufidx::collect_corpus_positions(txt, ix);

    sufidx::MappedIntArray a(ix, sufidx::MapMode::ReadOnly);
    assert(a.size() == n);
    std::vector<uint32_t> v;
    for (size_t i = 0; i < a.size(); ++i) v.push_back(a.get(i));
    return v;
}

int main() {
    auto dir = mk_tmp_dir();

    assert((collect(dir, "the cat sat on the mat") == std::vector<uint32_t>{0, 4, 8, 12, 15, 19}));

    // leading/trailing separators, digits, mixed case
    assert((collect(dir, "  Hello, World42!x") == std::vector<uint32_t>{2, 9, 17}));
    assert((collect(dir, "a-b_c") == std::vector<uint32_t>{0, 2, 4}));

    // bytes >= 0x80 are separators: "caf\xC3\xA9 na\xC3\xAFve"
    assert((collect(dir, "caf\xC3\xA9 na\xC3\xAFve") == std::vector<uint32_t>{0, 6, 10}));

    // boundary sizes
    assert(collect(dir, "").empty());
    assert((collect(dir, "x") == std::vector<uint32_t>{0}));
    assert(collect(dir, " ").empty());
    assert(collect(dir, "\n\n\t").empty());

    // completeness against a fixture: count == number of word starts
    {
        sufidx::MappedBytes t(test_data_file("sample.txt"));
        const auto ix = dir / "sample.ix";
        sufidx::IntArrayBuilder b(ix);
        const uint64_t n = sufidx::collect_positions(t, b);
        b.finish();
        assert(n > 0);
        assert(n == sufidx::count_word_starts(t));

        sufidx::MappedIntArray a(ix, sufidx::MapMode::ReadOnly);
        assert(a.size() == n);
        for (size_t i = 1; i < a.size(); ++i) assert(a.get(i - 1) < a.get(i));
    }

    std::filesystem::remove_all(dir);
    std::cout << "OK\n";
    return 0;
}

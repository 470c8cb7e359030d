#include <cassert>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <unistd.h>

#include "sufidx/builder.h"
#include "sufidx/errors.h"
#include "sufidx/search.h"

namespace fs = std::filesystem;

static fs::path mk_tmp_dir() {
    auto base = fs::temp_directory_path();
    auto p = base / ("sufidx_test_search_" + std::to_string((uint64_t)std::time(nullptr)) + "_" +
                     std::to_string((long)::getpid()));
    fs::create_directories(p);
    return p;
}

static fs::path test_data_file(const char* name) {
#ifndef SUFIDX_TEST_DATA_DIR
    return fs::path("tests/data") / name; // fallback
#else
    return fs::path(SUFIDX_TEST_DATA_DIR) / name;
#endif
}

static fs::path build_text(const fs::path& dir, const std::string& name, const std::string& content) {
    const auto p = dir / name;
    {
        std::ofstream out(p, std::ios::binary);
        out.write(content.data(), (std::streamsize)content.size());
    }
    sufidx::BuildOptions opt;
    opt.cutoff = 0;
    auto st = sufidx::build_suffix_array(p, opt);
    assert(st.validation.ok);
    return p;
}

int main() {
    using namespace sufidx;
    auto dir = mk_tmp_dir();

    // the cat sat on the mat
    {
        const auto txt = build_text(dir, "cat.txt", "the cat sat on the mat");
        MappedBytes text(txt);
        MappedIntArray index(derive_index_path(txt, kIndexSuffix), MapMode::ReadOnly);
        assert(index.size() == 6);

        auto first = binary_search_first("the", index, text);
        assert(first && *first == 4);
        assert(binary_search_first("cat", index, text) == std::optional<size_t>(0));
        assert(binary_search_first("mat", index, text) == std::optional<size_t>(1));
        assert(binary_search_first("the m", index, text) == std::optional<size_t>(5));
        assert(!binary_search_first("dog", index, text));
        assert(!binary_search_first("zzz", index, text));
        assert(!binary_search_first("aaa", index, text));
        assert(!binary_search_first("mats", index, text)); // runs past the end of the text

        SearchOptions opt;
        opt.context = 4;
        auto r = search_index(text, index, "the", opt);
        assert(r.first_index && *r.first_index == 4);
        assert(r.matches.size() == 2);
        assert(r.matches[0].offset == 0 && r.matches[1].offset == 15);
        assert(r.matches[1].left == " on " && r.matches[1].text == "the" && r.matches[1].right == " mat");

        assert(format_match_line(r.matches[0], 4) == "       0:      |the| cat");
        assert(format_match_line(r.matches[1], 4) == "      15:   on |the| mat");

        opt.max_matches = 1;
        r = search_index(text, index, "the", opt);
        assert(r.matches.size() == 1 && r.matches[0].offset == 0);

        opt.max_matches = 0;
        assert(search_index(text, index, "the", opt).matches.empty());

        // "at" is not a word start
        opt.max_matches = kNumMatches;
        r = search_index(text, index, "at", opt);
        assert(!r.first_index && r.matches.empty());

        auto j = to_json(search_index(text, index, "mat", opt));
        assert(j["count"] == 1);
        assert(j["matches"][0]["offset"] == 19);
    }

    // boundary sizes: empty and one-byte texts
    {
        const auto empty = build_text(dir, "empty.txt", "");
        auto r = search_files(empty, derive_index_path(empty, kIndexSuffix), "a", SearchOptions{});
        assert(!r.first_index && r.matches.empty());

        const auto one = build_text(dir, "one.txt", "a");
        r = search_files(one, derive_index_path(one, kIndexSuffix), "a", SearchOptions{});
        assert(r.first_index && *r.first_index == 0);
        assert(r.matches.size() == 1 && r.matches[0].offset == 0);
        r = search_files(one, derive_index_path(one, kIndexSuffix), "ab", SearchOptions{});
        assert(r.matches.empty());
        r = search_files(one, derive_index_path(one, kIndexSuffix), "b", SearchOptions{});
        assert(r.matches.empty());

        const auto sep = build_text(dir, "sep.txt", "-");
        r = search_files(sep, derive_index_path(sep, kIndexSuffix), "-", SearchOptions{});
        assert(r.matches.empty());
    }

    // context: newlines, line trimming, invalid UTF-8 at window edges
    {
        const auto txt = build_text(dir, "lines.txt", "alpha\nbeta gamma\r\ndelta");
        MappedBytes text(txt);
        MappedIntArray index(derive_index_path(txt, kIndexSuffix), MapMode::ReadOnly);

        SearchOptions opt;
        auto r = search_index(text, index, "gamma", opt);
        assert(r.matches.size() == 1);
        assert(r.matches[0].left == "alpha beta ");
        assert(r.matches[0].right == " delta");

        opt.trim_lines = true;
        r = search_index(text, index, "gamma", opt);
        assert(r.matches[0].left == "beta ");
        assert(r.matches[0].right == "\r");

        r = search_index(text, index, "beta gamma\r\nde", opt);
        assert(r.matches.size() == 1 && r.matches[0].text == "beta gamma de");

        // a two-byte sequence cut by the window edge is dropped
        const auto utf = build_text(dir, "utf.txt", "\xC3\xA9t\xC3\xA9 word \xC3\xA9t\xC3\xA9");
        MappedBytes t2(utf);
        MappedIntArray i2(derive_index_path(utf, kIndexSuffix), MapMode::ReadOnly);
        SearchOptions o2;
        o2.context = 2;
        r = search_index(t2, i2, "word", o2);
        assert(r.matches.size() == 1);
        assert(r.matches[0].left == " ");
        assert(r.matches[0].right == " ");
    }

    // fixture: every match has the key as prefix, none are missed
    {
        const auto src = test_data_file("sample.txt");
        const auto txt = dir / "sample.txt";
        fs::copy_file(src, txt, fs::copy_options::overwrite_existing);
        BuildOptions bopt;
        bopt.cutoff = 16;
        auto st = build_suffix_array(txt, bopt);
        assert(st.validation.ok);

        MappedBytes text(txt);
        MappedIntArray index(st.index_path, MapMode::ReadOnly);

        SearchOptions opt;
        opt.max_matches = 1000;
        for (const std::string key : {"it was", "It", "the", "abcabc", "Repeated", "42", "throne of", "CamelCase"}) {
            auto r = search_index(text, index, key, opt);

            size_t expect = 0;
            for (size_t i = 0; i < index.size(); ++i) {
                if (prefix_matches(key, index.get(i), text)) ++expect;
            }
            if (r.matches.size() != expect || expect == 0) {
                std::cerr << "FAIL: key '" << key << "' matches=" << r.matches.size()
                          << " expect=" << expect << "\n";
                return 2;
            }
            for (const auto& m : r.matches) assert(text.view(m.offset, key.size()) == key);
        }
    }

    // missing / malformed index
    {
        const auto txt = dir / "noindex.txt";
        std::ofstream(txt) << "some text";
        bool threw = false;
        try {
            search_files(txt, dir / "noindex.ix", "some", SearchOptions{});
        } catch (const IndexException& e) {
            threw = (e.code() == ErrorCode::IoError);
        }
        assert(threw);

        std::ofstream(dir / "noindex.ix", std::ios::binary) << "abcde";
        threw = false;
        try {
            search_files(txt, dir / "noindex.ix", "some", SearchOptions{});
        } catch (const IndexException& e) {
            threw = (e.code() == ErrorCode::InvalidFormat);
        }
        assert(threw);
    }

    fs::remove_all(dir);
    std::cout << "OK\n";
    return 0;
}

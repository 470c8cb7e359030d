#include <cassert>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

#include <unistd.h>

#include "sufidx/builder.h"
#include "sufidx/mapped_file.h"
#include "sufidx/validator.h"

namespace fs = std::filesystem;

static fs::path mk_tmp_dir() {
    auto base = fs::temp_directory_path();
    auto p = base / ("sufidx_test_validate_" + std::to_string((uint64_t)std::time(nullptr)) + "_" +
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

int main() {
    using namespace sufidx;
    auto dir = mk_tmp_dir();

    const auto txt = dir / "sample.txt";
    fs::copy_file(test_data_file("sample.txt"), txt, fs::copy_options::overwrite_existing);

    BuildOptions opt;
    auto st = build_suffix_array(txt, opt);
    assert(st.verified);
    assert(st.validation.ok);
    assert(st.validation.checked == st.positions);

    ValidateOptions vo;
    vo.check_complete = true;
    auto vr = validate_index_files(txt, st.index_path, vo);
    if (!vr.ok) {
        for (auto& e : vr.errors) std::cerr << e << "\n";
    }
    assert(vr.ok && vr.error_count == 0 && vr.errors.empty());

    {
        MappedBytes text(txt);
        MappedIntArray index(st.index_path, MapMode::ReadWrite);
        const size_t n = index.size();
        assert(n > 40);

        // one adjacent swap -> exactly one violation
        index.swap(10, 11);
        vr = validate_suffix_array(text, index);
        assert(!vr.ok);
        assert(vr.error_count == 1 && vr.errors.size() == 1);
        assert(vr.errors[0].find("Error in position 11") == 0);
        index.swap(10, 11);
        assert(validate_suffix_array(text, index).ok);

        // reversed -> n-1 violations, only the first ten reported
        for (size_t i = 0; i < n / 2; ++i) index.swap(i, n - 1 - i);
        vr = validate_suffix_array(text, index);
        assert(!vr.ok);
        assert(vr.error_count == n - 1);
        assert(vr.errors.size() == kMaxReportedErrors);

        ValidateOptions three;
        three.max_reported = 3;
        vr = validate_suffix_array(text, index, three);
        assert(vr.error_count == n - 1 && vr.errors.size() == 3);

        for (size_t i = 0; i < n / 2; ++i) index.swap(i, n - 1 - i);
        assert(validate_suffix_array(text, index).ok);

        // dangling pointer
        const uint32_t saved = index.get(n - 1);
        index.set(n - 1, (uint32_t)text.size() + 5);
        vr = validate_suffix_array(text, index);
        assert(!vr.ok && vr.error_count == 1);
        assert(vr.errors[0].find("out of range") != std::string::npos);
        index.set(n - 1, saved);

        std::ostringstream dump;
        dump_suffix_array(text, index, 3, dump);
        assert(dump.str().find("     ...") != std::string::npos);
    }

    // completeness: a sorted index missing one word start
    {
        MappedBytes text(txt);
        MappedIntArray index(st.index_path, MapMode::ReadOnly);
        const auto short_ix = dir / "short.ix";
        IntArrayBuilder b(short_ix);
        for (size_t i = 0; i + 1 < index.size(); ++i) b.append(index.get(i));
        b.finish();

        MappedIntArray shorter(short_ix, MapMode::ReadOnly);
        assert(validate_suffix_array(text, shorter).ok);
        vr = validate_suffix_array(text, shorter, vo);
        assert(!vr.ok && vr.error_count == 1);
        assert(vr.errors[0].find("word starts") != std::string::npos);
    }

    fs::remove_all(dir);
    std::cout << "OK\n";
    return 0;
}

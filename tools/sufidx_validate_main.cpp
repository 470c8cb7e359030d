// sufidx/tools/sufidx_validate_main.cpp
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include "sufidx/errors.h"
#include "sufidx/format.h"
#include "sufidx/validator.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

static bool env_bool(const char* key, bool defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    if (std::strcmp(s, "1") == 0) return true;
    if (std::strcmp(s, "0") == 0) return false;
    if (std::strcmp(s, "true") == 0 || std::strcmp(s, "TRUE") == 0) return true;
    if (std::strcmp(s, "false") == 0 || std::strcmp(s, "FALSE") == 0) return false;
    return defv;
}

// Parses a non-negative decimal count no larger than maxv.
static unsigned long long parse_count(const std::string& s, unsigned long long maxv) {
    if (s.empty() || s[0] == '-' || s[0] == '+') throw std::invalid_argument("expected a non-negative number, got '" + s + "'");
    size_t used = 0;
    unsigned long long v = std::stoull(s, &used);
    if (used != s.size()) throw std::invalid_argument("trailing characters in '" + s + "'");
    if (v > maxv) throw std::out_of_range("value " + s + " is larger than " + std::to_string(maxv));
    return v;
}

static void usage() {
    std::cerr << "Usage: sufidx_validate <textfile> [--suffix .ix] [--complete] [--dump N]\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }

    std::filesystem::path textfile;
    std::string suffix = sufidx::kIndexSuffix;
    size_t dump = 0;
    sufidx::ValidateOptions opt;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--suffix") suffix = arg_value(i, argc, argv);
            else if (a == "--complete") opt.check_complete = true;
            else if (a == "--dump") dump = (size_t)parse_count(arg_value(i, argc, argv), SIZE_MAX);
            else if (!a.empty() && a[0] == '-') {
                std::cerr << "Unknown option: " << a << "\n";
                usage();
                return 1;
            } else if (textfile.empty()) textfile = a;
            else {
                std::cerr << "Unexpected argument: " << a << "\n";
                usage();
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad argument: " << e.what() << "\n";
        usage();
        return 1;
    }

    if (textfile.empty()) {
        usage();
        return 1;
    }

    std::unique_ptr<sufidx::StderrProgress> progress;
    if (env_bool("SUFIDX_PROGRESS", false)) progress = std::make_unique<sufidx::StderrProgress>(std::cerr);

    try {
        const auto indexfile = sufidx::derive_index_path(textfile, suffix);

        sufidx::MappedBytes text(textfile, sufidx::MapMode::ReadOnly);
        sufidx::MappedIntArray index(indexfile, sufidx::MapMode::ReadOnly);

        if (dump > 0) sufidx::dump_suffix_array(text, index, dump, std::cerr);

        auto vr = sufidx::validate_suffix_array(text, index, opt, progress.get());

        nlohmann::json j;
        j["ok"] = vr.ok;
        j["checked"] = vr.checked;
        j["error_count"] = vr.error_count;
        j["errors"] = vr.errors;

        std::cout << j.dump() << "\n";
        return vr.ok ? 0 : 3;
    } catch (const sufidx::IndexException& e) {
        std::cerr << "sufidx_validate failed [" << sufidx::error_code_name(e.code()) << "]: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "sufidx_validate failed: " << e.what() << "\n";
        return 2;
    }
}

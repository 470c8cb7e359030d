#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include "sufidx/builder.h"
#include "sufidx/errors.h"
#include "sufidx/progress.h"

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
    std::cerr << "Usage: sufidx_build <textfile> [--suffix .ix] [--cutoff N]"
                 " [--pivot take-first|random|median-of-three] [--seed N] [--no-verify] [--quiet]\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }

    std::filesystem::path textfile;
    sufidx::BuildOptions opt;
    bool show_progress = env_bool("SUFIDX_PROGRESS", true);

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--suffix") opt.suffix = arg_value(i, argc, argv);
            else if (a == "--cutoff") opt.cutoff = (size_t)parse_count(arg_value(i, argc, argv), SIZE_MAX);
            else if (a == "--pivot") opt.pivot = arg_value(i, argc, argv);
            else if (a == "--seed") opt.seed = parse_count(arg_value(i, argc, argv), UINT64_MAX);
            else if (a == "--no-verify") opt.verify = false;
            else if (a == "--quiet") show_progress = false;
            else if (!a.empty() && a[0] == '-') {
                std::cerr << "Unknown option: " << a << "\n";
                usage();
                return 1;
            } else textfile = a;
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
    if (show_progress) progress = std::make_unique<sufidx::StderrProgress>(std::cerr);

    try {
        auto st = sufidx::build_suffix_array(textfile, opt, progress.get());

        nlohmann::json j;
        j["text"] = st.text_path.string();
        j["index"] = st.index_path.string();
        j["text_bytes"] = st.text_bytes;
        j["positions"] = st.positions;
        j["cutoff"] = st.cutoff;
        j["pivot"] = st.pivot;
        j["comparisons"] = {{"prefix", st.prefix_comparisons}, {"exact", st.exact_comparisons}};
        j["seconds"] = {{"collect", st.collect_seconds},
                        {"quicksort", st.quicksort_seconds},
                        {"insertion", st.insertion_seconds},
                        {"verify", st.verify_seconds}};
        j["verified"] = st.verified;
        j["ok"] = st.validation.ok;
        j["error_count"] = st.validation.error_count;
        j["built_at_utc"] = st.built_at_utc;
        std::cout << j.dump() << "\n";

        if (!st.validation.ok) {
            for (const auto& e : st.validation.errors) std::cerr << "# " << e << "\n";
            std::cerr << st.validation.error_count << " ordering errors!\n";
            return 3;
        }
        return 0;
    } catch (const sufidx::IndexException& e) {
        std::cerr << "sufidx_build failed [" << sufidx::error_code_name(e.code()) << "]: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "sufidx_build failed: " << e.what() << "\n";
        return 2;
    }
}

// sufidx/tools/sufidx_search_main.cpp
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include "sufidx/errors.h"
#include "sufidx/format.h"
#include "sufidx/search.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
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
    std::cerr << "Usage: sufidx_search <textfile> <search_string> [--suffix .ix]"
                 " [--num-matches|-n N] [--context|-c N] [--trim-lines|-t] [--json]\n";
}

int main(int argc, char** argv) {
    if (argc < 3) {
        usage();
        return 1;
    }

    std::filesystem::path textfile;
    std::string query;
    bool have_query = false;
    std::string suffix = sufidx::kIndexSuffix;
    bool as_json = false;
    sufidx::SearchOptions opt;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--suffix") suffix = arg_value(i, argc, argv);
            else if (a == "--num-matches" || a == "-n") opt.max_matches = (uint32_t)parse_count(arg_value(i, argc, argv), UINT32_MAX);
            else if (a == "--context" || a == "-c") opt.context = (uint32_t)parse_count(arg_value(i, argc, argv), UINT32_MAX);
            else if (a == "--trim-lines" || a == "-t") opt.trim_lines = true;
            else if (a == "--json") as_json = true;
            else if (textfile.empty()) {
                if (a.size() > 1 && a[0] == '-') {
                    std::cerr << "Unknown option: " << a << "\n";
                    usage();
                    return 1;
                }
                textfile = a;
            }
            else if (!have_query) {
                query = a;
                have_query = true;
            } else {
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

    if (textfile.empty() || !have_query) {
        usage();
        return 1;
    }

    try {
        const auto indexfile = sufidx::derive_index_path(textfile, suffix);
        auto r = sufidx::search_files(textfile, indexfile, query, opt);

        if (as_json) {
            std::cout << sufidx::to_json(r).dump() << "\n";
        } else {
            for (const auto& m : r.matches) {
                std::cout << sufidx::format_match_line(m, opt.context) << "\n";
            }
        }
        return 0;
    } catch (const sufidx::IndexException& e) {
        std::cerr << "sufidx_search failed [" << sufidx::error_code_name(e.code()) << "]: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "sufidx_search failed: " << e.what() << "\n";
        return 2;
    }
}

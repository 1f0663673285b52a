// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "olval.h"
#include "runner.hpp"
#include "utils.hpp"

namespace {

constexpr int max_suite_depth = 4;
constexpr std::string_view config_name = "validator.yaml";
constexpr std::string_view default_tests = "tests/conformance";

// Test cases grouped by the directory holding their validator.yaml
using suite_map = std::map<fs::path, std::vector<fs::path>>;

struct tally {
    unsigned passed{0};
    unsigned failed{0};
    unsigned xfailed{0};
    unsigned xpassed{0};

    [[nodiscard]] bool ok() const { return failed == 0 && xpassed == 0; }
};

void log_cb(OLVAL_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, [[maybe_unused]] uint64_t len)
{
    static constexpr std::array<const char *, 6> names{
        "trace", "debug", "info", "warn", "error", "off"};
    auto index = static_cast<std::size_t>(level);
    printf("[%s][%s:%s:%u]: %s\n", index < names.size() ? names[index] : "off", file, function,
        line, message);
}

bool is_case_file(const fs::path &path)
{
    return is_regular_file(path) && path.extension() == ".yaml" && path.filename() != config_name;
}

void add_suite(const fs::path &dir, suite_map &suites)
{
    auto &cases = suites[dir];
    for (const auto &entry : fs::directory_iterator{dir}) {
        if (is_case_file(entry.path())) {
            cases.push_back(entry.path());
        }
    }
}

void collect_suites(const fs::path &root, suite_map &suites)
{
    if (is_regular_file(root / config_name)) {
        add_suite(root, suites);
    }

    for (auto it = fs::recursive_directory_iterator{root};
         it != fs::recursive_directory_iterator{}; ++it) {
        if (!it->is_directory()) {
            continue;
        }

        if (it.depth() + 2 >= max_suite_depth) {
            it.disable_recursion_pending();
        }

        if (is_regular_file(it->path() / config_name)) {
            add_suite(it->path(), suites);
        }
    }
}

void report(const fs::path &file, const test_runner::result &res, tally &counts)
{
    const auto &[passed, expected_fail, error, output] = res;

    std::cout << file.string() << " => ";
    if (passed && !expected_fail) {
        std::cout << term::colour::green << "Passed";
        ++counts.passed;
    } else if (passed) {
        std::cout << term::colour::magenta << "Expected to fail but passed";
        ++counts.xpassed;
    } else if (expected_fail) {
        std::cout << term::colour::yellow << "Failed (expected): " << error;
        ++counts.xfailed;
    } else {
        std::cout << term::colour::red << "Failed: " << error;
        if (!output.empty()) {
            std::cout << '\n' << output;
        }
        ++counts.failed;
    }
    std::cout << term::colour::off << '\n';
}

void print_summary(const tally &counts)
{
    std::cout << term::colour::blue << "\nResult: " << term::colour::off << counts.passed
              << " passed, " << counts.failed << " failed, " << counts.xfailed << " xfailed, "
              << counts.xpassed << " xpassed\n";

    if (counts.ok()) {
        std::cout << term::colour::green << "Validation succeeded\n" << term::colour::off;
    } else {
        std::cout << term::colour::red << "Validation failed\n" << term::colour::off;
    }
}

void print_help(std::string_view name)
{
    std::cerr << "Usage: " << name << " [OPTION]...\n"
              << "    --tests <FILE|DIR>... Test files or directories (default: " << default_tests
              << ")\n"
              << "    --verbose             Set logging to trace\n"
              << "    --help                Shows this help\n";
}

} // namespace

int main(int argc, char *argv[])
{
    suite_map suites;
    bool tests_given = false;

    for (int i = 1; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--verbose") {
            olval_set_log_cb(log_cb, OLVAL_LOG_TRACE);
        } else if (arg == "--help") {
            print_help(argv[0]);
            return EXIT_SUCCESS;
        } else if (arg == "--tests") {
            tests_given = true;
            for (; i + 1 < argc && !std::string_view{argv[i + 1]}.starts_with("--"); ++i) {
                const fs::path path = argv[i + 1];
                if (is_directory(path)) {
                    collect_suites(path, suites);
                } else if (is_case_file(path) &&
                           is_regular_file(path.parent_path() / config_name)) {
                    suites[path.parent_path()].push_back(path);
                }
            }
        } else {
            std::cerr << "Unknown option " << arg << '\n';
            print_help(argv[0]);
            return EXIT_FAILURE;
        }
    }

    if (!tests_given && is_directory(fs::path{default_tests})) {
        collect_suites(default_tests, suites);
    }

    if (suites.empty()) {
        std::cerr << "No test suites found\n";
        return EXIT_FAILURE;
    }

    tally counts;
    for (auto &[dir, cases] : suites) {
        std::sort(cases.begin(), cases.end());
        std::cout << term::colour::cyan << "Testing: " << dir.string() << term::colour::off
                  << '\n';

        try {
            test_runner runner(dir / config_name);
            for (const auto &file : cases) { report(file, runner.run(file), counts); }
        } catch (const std::exception &e) {
            std::cout << term::colour::red << "Invalid config " << (dir / config_name).string()
                      << ": " << e.what() << term::colour::off << '\n';
            ++counts.failed;
        }
    }

    print_summary(counts);
    return counts.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}

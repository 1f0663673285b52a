// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "olval.h"

namespace {

struct verdict {
    std::string candidate;
    bool valid;
};

// NOLINTNEXTLINE
auto parse_args(int argc, char *argv[])
{
    const std::map<std::string, std::string, std::less<>> arg_mapping{{"-V", "--validator"},
        {"--validator", "--validator"}, {"-c", "--candidate"}, {"--candidate", "--candidate"},
        {"-f", "--format"}, {"--format", "--format"}, {"-v", "--verbose"},
        {"--verbose", "--verbose"}, {"-h", "--help"}, {"--help", "--help"}};

    std::unordered_map<std::string, std::vector<std::string>> args;
    auto last_arg = args.end();
    bool options_done = false;
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (!options_done) {
            if (arg == "--") {
                options_done = true;
                continue;
            }

            // Anything outside the mapping is a value, e.g. "-4111111111111111"
            if (auto long_arg = arg_mapping.find(arg); long_arg != arg_mapping.end()) {
                auto [it, res] = args.emplace(long_arg->second, std::vector<std::string>{});
                last_arg = it;
                continue;
            }

            if (arg.starts_with("--")) {
                throw std::invalid_argument("unknown option " + std::string{arg});
            }
        }

        if (last_arg == args.end()) {
            throw std::invalid_argument("unexpected argument " + std::string{arg});
        }
        last_arg->second.emplace_back(arg);
    }
    return args;
}

void print_help(std::string_view name)
{
    std::cerr << "Usage: " << name << " --validator <luhn|ssn_format> [OPTION]...\n"
              << "    -V, --validator <NAME>       Validator to run on each candidate\n"
              << "    -c, --candidate <STRING>...  Candidates, read from stdin when absent\n"
              << "    -f, --format <text|json>     Output format (default: text)\n"
              << "    -v, --verbose                Log rejections to stderr\n"
              << "    -h, --help                   Shows this help\n";
}

void log_cb(OLVAL_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, [[maybe_unused]] uint64_t len)
{
    static constexpr std::array<const char *, 6> names{
        "trace", "debug", "info", "warn", "error", "off"};
    auto index = static_cast<std::size_t>(level);
    fprintf(stderr, "[%s][%s:%s:%u]: %s\n", index < names.size() ? names[index] : "off", file,
        function, line, message);
}

std::vector<std::string> read_candidates(std::istream &is)
{
    std::vector<std::string> candidates;
    std::string line;
    while (std::getline(is, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        candidates.emplace_back(std::move(line));
    }
    return candidates;
}

void print_text(const std::vector<verdict> &verdicts)
{
    for (const auto &[candidate, valid] : verdicts) {
        std::cout << (valid ? "valid" : "invalid") << '\t' << candidate << '\n';
    }
}

void print_json(std::string_view validator, const std::vector<verdict> &verdicts)
{
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<decltype(buffer)> writer(buffer);

    unsigned valid_count = 0;

    writer.StartObject();
    writer.Key("validator");
    writer.String(validator.data(), static_cast<rapidjson::SizeType>(validator.size()));
    writer.Key("results");
    writer.StartArray();
    for (const auto &[candidate, valid] : verdicts) {
        writer.StartObject();
        writer.Key("candidate");
        writer.String(candidate.data(), static_cast<rapidjson::SizeType>(candidate.size()));
        writer.Key("valid");
        writer.Bool(valid);
        writer.EndObject();

        valid_count += valid ? 1 : 0;
    }
    writer.EndArray();
    writer.Key("valid");
    writer.Uint(valid_count);
    writer.Key("invalid");
    writer.Uint(static_cast<unsigned>(verdicts.size()) - valid_count);
    writer.EndObject();

    std::cout << buffer.GetString() << '\n';
}

} // namespace

int main(int argc, char *argv[])
{
    std::unordered_map<std::string, std::vector<std::string>> args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::exception &e) {
        std::cerr << e.what() << '\n';
        print_help(argv[0]);
        return EXIT_FAILURE;
    }

    if (args.contains("--help")) {
        print_help(argv[0]);
        return EXIT_SUCCESS;
    }

    if (args.contains("--verbose")) {
        olval_set_log_cb(log_cb, OLVAL_LOG_TRACE);
    }

    auto validator_arg = args.find("--validator");
    if (validator_arg == args.end() || validator_arg->second.size() != 1) {
        std::cerr << "A single validator is required\n";
        print_help(argv[0]);
        return EXIT_FAILURE;
    }

    const auto &name = validator_arg->second[0];
    auto validator = olval_validator_from_string(name.data(), name.size());
    if (validator == OLVAL_VALIDATOR_INVALID) {
        std::cerr << "Unknown validator " << name << '\n';
        print_help(argv[0]);
        return EXIT_FAILURE;
    }

    std::string_view format = "text";
    if (auto format_arg = args.find("--format"); format_arg != args.end()) {
        if (format_arg->second.size() != 1 ||
            (format_arg->second[0] != "text" && format_arg->second[0] != "json")) {
            std::cerr << "Format must be one of text or json\n";
            print_help(argv[0]);
            return EXIT_FAILURE;
        }
        format = format_arg->second[0];
    }

    std::vector<std::string> candidates;
    if (auto candidate_arg = args.find("--candidate"); candidate_arg != args.end()) {
        candidates = std::move(candidate_arg->second);
    } else {
        candidates = read_candidates(std::cin);
    }

    std::vector<verdict> verdicts;
    verdicts.reserve(candidates.size());
    for (auto &candidate : candidates) {
        const bool valid = olval_validate(validator, candidate.data(), candidate.size());
        verdicts.push_back({std::move(candidate), valid});
    }

    if (format == "json") {
        print_json(name, verdicts);
    } else {
        print_text(verdicts);
    }

    return EXIT_SUCCESS;
}

// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>

#include "assert.hpp"
#include "olval.h"
#include "runner.hpp"
#include "utils.hpp"

test_runner::test_runner(const fs::path &config_file)
{
    YAML::Node doc = YAML::Load(read_file(config_file.string()));

    name_ = doc["validator"].as<std::string>();
    validator_ = olval_validator_from_string(name_.data(), name_.size());
    if (validator_ == OLVAL_VALIDATOR_INVALID) {
        throw std::runtime_error("Invalid validator " + name_);
    }
}

bool test_runner::run_test(const YAML::Node &runs)
{
    bool passed = false;

    try {
        expect(true, runs.IsDefined());
        expect(true, runs.IsSequence());
        expect(true, runs.size() > 0);

        std::size_t index = 0;
        for (auto it = runs.begin(); it != runs.end(); ++it, ++index) {
            YAML::Node run = *it;

            auto input = run["input"].as<std::string>();
            auto expected = run["valid"].as<bool>();

            auto obtained = olval_validate(validator_, input.data(), input.size());
            if (obtained != expected) {
                output_ << "run #" << index << ": " << name_ << "(\"" << input << "\") => "
                        << std::boolalpha << obtained;
            }

            expect(expected, obtained);
            expect(obtained, olval_validate(validator_, input.data(), input.size()));
        }
        passed = true;
    } catch (const std::exception &e) {
        error_ << e.what();
    }

    return passed;
}

test_runner::result test_runner::run(const fs::path &file)
{
    output_ = {};
    error_ = {};

    bool passed = false;
    bool expected_fail = false;

    try {
        YAML::Node sample = YAML::Load(read_file(file.string()));

        if (sample["expected-fail"].IsDefined()) {
            expected_fail = sample["expected-fail"].as<bool>();
        }

        passed = run_test(sample["runs"]);
    } catch (const std::exception &e) {
        error_ << e.what();
    }

    return {passed, expected_fail, error_.str(), output_.str()};
}

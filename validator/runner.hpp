// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <filesystem>
#include <sstream>
#include <string>
#include <tuple>
#include <yaml-cpp/yaml.h>

#include "olval.h"

namespace fs = std::filesystem;

class test_runner {
public:
    // passed, expected fail, error, output
    using result = std::tuple<bool, bool, std::string, std::string>;
    explicit test_runner(const fs::path &config_file);

    test_runner(const test_runner &) = delete;
    test_runner(test_runner &&) = delete;

    test_runner &operator=(const test_runner &) = delete;
    test_runner &operator=(test_runner &&) = delete;

    ~test_runner() = default;

    result run(const fs::path &sample_file);

protected:
    bool run_test(const YAML::Node &runs);

    std::string name_;
    OLVAL_VALIDATOR validator_{OLVAL_VALIDATOR_INVALID};
    std::stringstream output_;
    std::stringstream error_;
};

// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>

#include "log.hpp"
#include "olval.h"

namespace olval {

static_assert(static_cast<uint32_t>(log_level::trace) == OLVAL_LOG_TRACE);
static_assert(static_cast<uint32_t>(log_level::debug) == OLVAL_LOG_DEBUG);
static_assert(static_cast<uint32_t>(log_level::info) == OLVAL_LOG_INFO);
static_assert(static_cast<uint32_t>(log_level::warn) == OLVAL_LOG_WARN);
static_assert(static_cast<uint32_t>(log_level::error) == OLVAL_LOG_ERROR);
static_assert(static_cast<uint32_t>(log_level::off) == OLVAL_LOG_OFF);

olval_log_cb logger::cb = nullptr;
log_level logger::min_level = log_level::off;

void logger::init(olval_log_cb cb, log_level min_level)
{
    logger::cb = cb;
    logger::min_level = min_level;
}

void logger::log(log_level level, const char *function, const char *file, unsigned line,
    const char *message, size_t length)
{
    logger::cb(static_cast<OLVAL_LOG_LEVEL>(level), function, file, line, message, length);
}

} // namespace olval

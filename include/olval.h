// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#ifndef OLVAL_H
#define OLVAL_H

#ifdef __cplusplus
#include <cstddef>
extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum OLVAL_VALIDATOR
 *
 * Identifier classes which can be validated.
 **/
typedef enum
{
    OLVAL_VALIDATOR_INVALID    = 0,
    // Payment card number, 13 to 19 digits with a Luhn check digit
    OLVAL_VALIDATOR_LUHN       = 1,
    // 9-digit national identifier, area / group / serial format check
    OLVAL_VALIDATOR_SSN_FORMAT = 2,
} OLVAL_VALIDATOR;

/**
 * @enum OLVAL_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    OLVAL_LOG_TRACE,
    OLVAL_LOG_DEBUG,
    OLVAL_LOG_INFO,
    OLVAL_LOG_WARN,
    OLVAL_LOG_ERROR,
    OLVAL_LOG_OFF,
} OLVAL_LOG_LEVEL;

/**
 * @typedef olval_log_cb
 *
 * Callback that the library will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The logging message, NUL-terminated.
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*olval_log_cb)(
    OLVAL_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * olval_validate_luhn
 *
 * Validates a payment card candidate. Non-digit characters are ignored, the
 * remaining digits must be between 13 and 19 and carry a valid Luhn checksum.
 *
 * @param str Candidate string, not necessarily NUL-terminated. (nullable)
 * @param length Length of the candidate string.
 *
 * @return Whether the candidate is valid, false if str is NULL.
 *
 * @note This function is thread-safe
 **/
bool olval_validate_luhn(const char *str, size_t length);

/**
 * olval_validate_ssn_format
 *
 * Validates the format of a 9-digit national identifier candidate. Non-digit
 * characters are ignored. Reserved areas (000, 666, 900-999), group 00 and
 * serial 0000 are rejected.
 *
 * @param str Candidate string, not necessarily NUL-terminated. (nullable)
 * @param length Length of the candidate string.
 *
 * @return Whether the candidate is valid, false if str is NULL.
 *
 * @note This function is thread-safe
 **/
bool olval_validate_ssn_format(const char *str, size_t length);

/**
 * olval_validate
 *
 * Validates a candidate with the given validator.
 *
 * @param validator The validator to use.
 * @param str Candidate string, not necessarily NUL-terminated. (nullable)
 * @param length Length of the candidate string.
 *
 * @return Whether the candidate is valid, false if str is NULL or the
 *         validator is OLVAL_VALIDATOR_INVALID.
 *
 * @note This function is thread-safe
 **/
bool olval_validate(OLVAL_VALIDATOR validator, const char *str, size_t length);

/**
 * olval_validator_from_string
 *
 * Obtain a validator from its name, e.g. "luhn" or "ssn_format".
 *
 * @param name Validator name. (nullable)
 * @param length Length of the validator name.
 *
 * @return The validator or OLVAL_VALIDATOR_INVALID if the name is unknown.
 **/
OLVAL_VALIDATOR olval_validator_from_string(const char *name, size_t length);

/**
 * olval_is_available
 *
 * Capability probe for bindings which optionally load the library.
 *
 * @return true
 **/
bool olval_is_available(void);

/**
 * olval_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *olval_get_version(void);

/**
 * olval_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool olval_set_log_cb(olval_log_cb cb, OLVAL_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /* OLVAL_H */

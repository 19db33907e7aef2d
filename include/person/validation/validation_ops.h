/**
 * @file validation_ops.h
 * @brief Reporting helpers for validation results
 */

#pragma once

#include "person/validation/person_validator.h"

#include <string>

namespace person::validation {

/**
 * @brief Join the messages of errors in order
 *
 * @param errors Accumulated errors
 * @param separator Inserted between messages
 * @return e.g. "Name cannot be empty or contain only white space, Age cannot be negative"
 */
std::string joinErrors(const NonEmptyList<ValidationError>& errors,
                       const std::string& separator = ", ");

/// @brief Comma-separated error codes (e.g., "BLANK_NAME,NEGATIVE_AGE")
std::string joinErrorCodes(const NonEmptyList<ValidationError>& errors);

/**
 * @brief One-line description of a result
 *
 * "Valid: Person(name=Alice, age=30)" or "Invalid: <joined messages>"
 */
std::string describe(const ValidationResult& result);

/**
 * @brief Emit one log record for a result
 *
 * Valid results are logged at debug level, invalid ones at warn level.
 */
void logOutcome(const ValidationResult& result);

} // namespace person::validation

/**
 * @file types.h
 * @brief Common types for the person validation library
 *
 * Error tags, their codes and messages, and the raw input record.
 */

#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace person::validation {

/// @brief Inclusive upper bound for a person's age
inline constexpr int MAX_AGE = 130;

/// @brief Violated validation rule, in rule evaluation order
enum class ValidationError {
    BlankName,      ///< Name is absent, empty or whitespace-only
    NegativeAge,    ///< Age is below zero
    MaxAgeExceeded  ///< Age is above MAX_AGE
};

/// @brief Raw candidate data, not yet validated
struct PersonInput {
    std::optional<std::string> name;  ///< std::nullopt counts as blank
    int age = 0;
};

/// @brief Convert ValidationError to its tag name
inline std::string toString(ValidationError e) {
    switch (e) {
        case ValidationError::BlankName:      return "BlankName";
        case ValidationError::NegativeAge:    return "NegativeAge";
        case ValidationError::MaxAgeExceeded: return "MaxAgeExceeded";
    }
    return "Unknown";
}

/// @brief Stable machine-readable code (e.g., "BLANK_NAME")
inline std::string errorCode(ValidationError e) {
    switch (e) {
        case ValidationError::BlankName:      return "BLANK_NAME";
        case ValidationError::NegativeAge:    return "NEGATIVE_AGE";
        case ValidationError::MaxAgeExceeded: return "MAX_AGE_EXCEEDED";
    }
    return "UNKNOWN";
}

/// @brief Human-readable message
inline std::string errorMessage(ValidationError e) {
    switch (e) {
        case ValidationError::BlankName:
            return "Name cannot be empty or contain only white space";
        case ValidationError::NegativeAge:
            return "Age cannot be negative";
        case ValidationError::MaxAgeExceeded:
            return "Age cannot be bigger than " + std::to_string(MAX_AGE) + " years";
    }
    return "Unknown validation error";
}

inline std::ostream& operator<<(std::ostream& os, ValidationError e) {
    return os << toString(e);
}

} // namespace person::validation
